#include <cassert>
#include <string>

#include "castellan/constants.hpp"
#include "castellan/model/fen.hpp"
#include "castellan/model/position_error.hpp"

using namespace castellan;
using namespace castellan::model;
using core::Color;

static core::Square sq(char file, int rank)
{
  int f = file - 'a';
  int r = rank - 1;
  return static_cast<core::Square>(r * 8 + f);
}

static bool rejects(const char* text)
{
  try
  {
    (void)fen::parse(text);
  }
  catch (const InvalidPositionError&)
  {
    return true;
  }
  return false;
}

int main()
{
  // Round trips
  {
    for (const char* text : {
             "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
             "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
             "rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 3",
             "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
             "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
             "4k3/8/8/8/8/8/8/4K3 b - - 57 120",
         })
      assert(fen::write(fen::parse(text)) == text);

    assert(fen::write(Position::start(BackRankId::standard())) == core::START_FEN);
  }

  // Clocks and side to move
  {
    const Position p = fen::parse("4k3/8/8/8/8/8/8/4K3 b - - 57 120");
    assert(p.sideToMove() == Color::Black);
    assert(p.halfmoveClock() == 57);
    assert(p.fullmoveNumber() == 120);
    assert(p.moveId().value() == 2 * 119 + 1);

    const Position shortForm = fen::parse("4k3/8/8/8/8/8/8/4K3 w -  -");
    assert(shortForm.halfmoveClock() == 0 && shortForm.fullmoveNumber() == 1);
    assert(fen::write(shortForm) == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
  }

  // Chess960 castling fields: Shredder letters, X-FEN letters, mixed
  {
    const char* shredder = "bqnb1rkr/pp3ppp/3ppn2/2p5/5P2/P2P4/NPP1P1PP/BQ1BNRKR w HFhf - 2 9";
    const Position p = fen::parse(shredder);
    const CastlingRights& cr = p.castlingRights();
    for (auto c : {Color::White, Color::Black})
    {
      assert(cr.kingFile(c) == 6);
      assert(cr.rookFile(c, CastleSide::KingSide) == 7);
      assert(cr.rookFile(c, CastleSide::QueenSide) == 5);
    }
    // Both rooks are the outermost on their side, so X-FEN uses KQkq
    assert(fen::write(p) == "bqnb1rkr/pp3ppp/3ppn2/2p5/5P2/P2P4/NPP1P1PP/BQ1BNRKR w KQkq - 2 9");
    assert(fen::parse(fen::write(p)) == p);

    // Standard position written with Shredder letters
    assert(fen::parse("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w HAha - 0 1") ==
           Position::start(BackRankId::standard()));

    // An inner rook needs its file letter
    const Position inner = fen::parse("4k3/8/8/8/8/8/8/1R2K1RR w G - 0 1");
    assert(inner.castlingRights().rookFile(Color::White, CastleSide::KingSide) == 6);
    assert(fen::write(inner) == "4k3/8/8/8/8/8/8/1R2K1RR w G - 0 1");
    const Position outer = fen::parse("4k3/8/8/8/8/8/8/1R2K1RR w KQ - 0 1");
    assert(outer.castlingRights().rookFile(Color::White, CastleSide::KingSide) == 7);
    assert(outer.castlingRights().rookFile(Color::White, CastleSide::QueenSide) == 1);
    assert(fen::write(outer) == "4k3/8/8/8/8/8/8/1R2K1RR w KQ - 0 1");
  }

  // En passant square
  {
    const Position p = fen::parse("rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 3");
    assert(p.enPassantSquare() == sq('e', 3));
  }

  // Malformed text
  {
    assert(rejects(""));
    assert(rejects("8/8/8/8/8/8/8/8"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 x - - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3/8 w - - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/4K3 w - - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K4 w - - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4X3 w - - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 w Z - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/R3K2R w KK - 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 w - e9 0 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 w - - x 1"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 w - - 0 1 extra"));
    assert(rejects("4k3/8/8/8/8/8/8/4K3 w - - 99999 1"));
    assert(!rejects("4k3/8/8/8/8/8/8/4K3 w - - 0 0"));
  }

  return 0;
}
