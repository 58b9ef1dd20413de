#include <array>
#include <cassert>
#include <set>
#include <string>

#include "castellan/model/back_rank.hpp"
#include "castellan/model/castling.hpp"
#include "castellan/model/position.hpp"
#include "castellan/model/position_error.hpp"

using namespace castellan;
using namespace castellan::model;
using PT = core::PieceType;

static std::array<PT, 8> rank_of_text(const char* s)
{
  std::array<PT, 8> out{};
  for (int i = 0; i < 8; ++i)
  {
    switch (s[i])
    {
    case 'K':
      out[i] = PT::King;
      break;
    case 'Q':
      out[i] = PT::Queen;
      break;
    case 'R':
      out[i] = PT::Rook;
      break;
    case 'B':
      out[i] = PT::Bishop;
      break;
    case 'N':
      out[i] = PT::Knight;
      break;
    default:
      out[i] = PT::None;
      break;
    }
  }
  return out;
}

int main()
{
  // Known Scharnagl numbers
  {
    assert(BackRank::standard().pieces() == rank_of_text("RNBQKBNR"));
    assert(BackRankId::standard().value() == 518);
    assert(BackRankId::standard().isStandard());
    assert(BackRank::fromId(BackRankId(0)).pieces() == rank_of_text("BBQNNRKR"));
    assert(BackRank::fromId(BackRankId(959)).pieces() == rank_of_text("RKRNNQBB"));
    assert(BackRank::fromPieces(rank_of_text("RNBQKBNR")).id().value() == 518);
  }

  // Every id decodes to a valid, distinct rank that encodes back to the same id
  {
    std::set<std::array<PT, 8>> seen;
    for (int n = 0; n < core::NUM_BACK_RANKS; ++n)
    {
      const BackRank br = BackRank::fromId(BackRankId(n));
      assert(br.id().value() == n);
      assert(seen.insert(br.pieces()).second);

      const auto rooks = br.rooks();
      assert(rooks[0] < br.king() && br.king() < rooks[1]);
      const auto bishops = br.bishops();
      assert((bishops[0] & 1) != (bishops[1] & 1));

      // Round trip through the validating constructor as well
      assert(BackRank::fromPieces(br.pieces()) == br);
    }
    assert(seen.size() == 960);
  }

  // Out of range ids and malformed ranks are rejected
  {
    bool threw = false;
    try
    {
      (void)BackRankId(960);
    }
    catch (const InvalidPositionError&)
    {
      threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
      (void)BackRankId(-1);
    }
    catch (const InvalidPositionError&)
    {
      threw = true;
    }
    assert(threw);

    for (const char* bad : {"RNBKQBNR", "KRNBQBNR", "RNBQKNBR", "RNNQKNBR", "RQBQKBNR"})
    {
      threw = false;
      try
      {
        (void)BackRank::fromPieces(rank_of_text(bad));
      }
      catch (const InvalidPositionError&)
      {
        threw = true;
      }
      assert(threw == (std::string(bad) != "RNBKQBNR"));
    }
  }

  // Starting positions carry full castling rights on the dealt files
  {
    const BackRank br = BackRank::fromPieces(rank_of_text("NRKBBQRN"));
    const Position p = Position::start(br);
    const CastlingRights& cr = p.castlingRights();
    for (auto c : {core::Color::White, core::Color::Black})
    {
      assert(cr.kingFile(c) == 2);
      assert(cr.rookFile(c, CastleSide::QueenSide) == 1);
      assert(cr.rookFile(c, CastleSide::KingSide) == 6);
    }
    assert(p.sideToMove() == core::Color::White);
    assert(p.moveId() == MoveId::start());
    assert(MoveId::start().value() == 0 && MoveId::start().turn() == core::Color::White);
    assert(BackRankId::standard().value() == 518 && BackRankId::standard().isStandard());
    assert(p.halfmoveClock() == 0);
    assert(p.fullmoveNumber() == 1);
    p.validate();
  }

  return 0;
}
