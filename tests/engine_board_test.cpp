#include <cassert>
#include <string>
#include <vector>

#include "castellan/model/fen.hpp"
#include "castellan/model/position_error.hpp"
#include "castellan/play/engine_board.hpp"
#include "castellan/play/errors.hpp"

using namespace castellan;
using namespace castellan::model;
using play::EngineBoard;
using play::PlayError;

static std::vector<Move> moves_of(const std::vector<std::string>& text)
{
  std::vector<Move> out;
  for (const auto& t : text)
  {
    const auto m = parse_move(t);
    assert(m);
    out.push_back(*m);
  }
  return out;
}

int main()
{
  // Incremental play and replay agree on position, history and result
  {
    const auto game = moves_of({"e2e4", "e7e5", "g1f3", "b8c6", "f1c4", "g8f6", "e1g1", "f8c5",
                                "d2d4", "c5d4", "f3d4", "c6d4", "d1d4", "d7d6", "c1g5", "e8g8"});
    EngineBoard live;
    for (const auto& m : game)
    {
      const auto r = live.apply(m);
      assert(r.ok());
      assert(r.moveId == live.position().moveId());
    }
    assert(live.history().plyCount() == game.size());
    assert(live.position().moveId().value() == game.size());
    assert(live.position().fullmoveNumber() == 9);
    assert(live.sideToMove() == core::Color::White);
    assert(!live.position().castlingRights().any());

    const EngineBoard replayed = EngineBoard::replay(play::GameConfig{}, game);
    assert(replayed.position() == live.position());
    assert(replayed.history().moves() == live.history().moves());
    assert(replayed.result() == live.result());

    // Castling entered as king to rook gives the same game
    auto kingToRook = game;
    kingToRook[6] = Move{bb::E1, bb::H1};
    kingToRook[15] = Move{bb::E8, bb::H8};
    assert(EngineBoard::replay(play::GameConfig{}, kingToRook).position() == live.position());
  }

  // Replay of a finished game reproduces its result
  {
    const auto game = moves_of({"e2e4", "e7e5", "f1c4", "b8c6", "d1h5", "g8f6", "h5f7"});
    EngineBoard live;
    for (const auto& m : game)
      assert(live.apply(m).ok());
    assert(live.result() && live.result()->winner() == core::Color::White);
    const EngineBoard replayed = EngineBoard::replay(play::GameConfig{}, game);
    assert(replayed.result() == live.result());
    assert(replayed.position() == live.position());
  }

  // Rejected moves leave the board untouched
  {
    EngineBoard board;
    assert(board.apply(*parse_move("e2e4")).ok());
    const Position before = board.position();

    // wrong side, empty square, blocked, off the legal set, bad promotion
    for (const char* bad : {"d2d4", "e4e6", "d1d3", "e4e5x", "a7a5q"})
    {
      const auto m = parse_move(bad);
      if (!m)
        continue;
      const auto r = board.apply(*m);
      assert(!r.ok() && *r.error == PlayError::IllegalMove);
      assert(board.position() == before);
      assert(board.history().plyCount() == 1);
      assert(!board.result());
    }
    assert(!board.isLegal(*parse_move("d2d4")));
    assert(board.isLegal(*parse_move("e7e5")));
  }

  // A pinned piece may not leave the pin ray; moving into check is refused
  {
    EngineBoard board(fen::parse("4r1k1/8/8/8/8/8/4N3/4K3 w - - 0 1"));
    const auto r = board.apply(*parse_move("e2c3"));
    assert(!r.ok() && *r.error == PlayError::IllegalMove);

    EngineBoard king(fen::parse("4k3/8/8/8/8/8/3r4/4K3 w - - 0 1"));
    assert(!king.apply(*parse_move("e1e2")).ok());
    assert(!king.apply(*parse_move("e1d1")).ok());
    assert(king.history().plyCount() == 0);
    assert(king.apply(*parse_move("e1d2")).ok());
  }

  // Results from outside the rules engine
  {
    EngineBoard board;
    assert(!board.resign(core::Color::White));
    assert(*board.result() == GameResult::win(core::Color::Black, WinReason::Resigned));
    assert(board.agreeDraw() == PlayError::GameAlreadyTerminal);
    assert(board.declareResult(GameResult::draw(DrawReason::Agreed)) ==
           PlayError::GameAlreadyTerminal);
    const auto r = board.apply(*parse_move("e2e4"));
    assert(!r.ok() && *r.error == PlayError::GameAlreadyTerminal);
    assert(board.legalMoves().empty());

    EngineBoard drawn;
    assert(!drawn.agreeDraw());
    assert(drawn.result()->isDraw());

    EngineBoard flagged;
    assert(!flagged.declareResult(GameResult::win(core::Color::White, WinReason::TimeExpired)));
    assert(flagged.result()->winReason() == WinReason::TimeExpired);
  }

  // Replay stops at the first rejected move and reports its index
  {
    const auto game = moves_of({"e2e4", "e7e5", "e4e5", "d7d5"});
    bool threw = false;
    try
    {
      (void)EngineBoard::replay(play::GameConfig{}, game);
    }
    catch (const play::PlayException& e)
    {
      threw = true;
      assert(e.error() == PlayError::IllegalMove);
      assert(e.moveIndex() && *e.moveIndex() == 2);
      assert(std::string(e.what()).find("e4e5") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try
    {
      (void)EngineBoard::replay(play::GameConfig{},
                                moves_of({"f2f3", "e7e5", "g2g4", "d8h4", "a2a3"}));
    }
    catch (const play::PlayException& e)
    {
      threw = true;
      assert(e.error() == PlayError::GameAlreadyTerminal);
      assert(*e.moveIndex() == 4);
    }
    assert(threw);
  }

  // Malformed starting positions are refused at construction
  {
    for (const char* bad : {"4k3/8/8/8/8/8/8/4KK2 w - - 0 1", "4k3/8/8/8/8/8/8/8 w - - 0 1",
                            "4k3/8/8/8/8/8/8/4R1K1 w - - 0 1", "4k2P/8/8/8/8/8/8/4K3 w - - 0 1",
                            "4k3/8/8/8/8/8/8/4K3 w K - 0 1", "4k3/8/8/8/4P3/8/8/4K3 w - e3 0 1"})
    {
      bool threw = false;
      try
      {
        (void)fen::parse(bad);
      }
      catch (const InvalidPositionError&)
      {
        threw = true;
      }
      assert(threw);
    }

    // The empty placeholder position is checked by the board itself
    bool threw = false;
    try
    {
      EngineBoard b{Position{}};
    }
    catch (const play::PlayException& e)
    {
      threw = true;
      assert(e.error() == play::PlayError::InvalidPosition);
      assert(!e.moveIndex());
    }
    assert(threw);

    threw = false;
    try
    {
      (void)EngineBoard::replay(Position{}, model::RulesConfig{}, moves_of({"e2e4"}));
    }
    catch (const play::PlayException& e)
    {
      threw = true;
      assert(e.error() == play::PlayError::InvalidPosition);
      assert(std::string(play::to_string(e.error())) == "invalid_position");
    }
    assert(threw);
  }

  // Chess960 game from a back-rank id
  {
    play::GameConfig cfg;
    cfg.backRank = BackRankId(0);
    EngineBoard board(cfg);
    assert(board.position().pieceAt(bb::A1) ==
           (bb::Piece{core::PieceType::Bishop, core::Color::White}));
    assert(board.legalMoves().size() == 20);
  }

  return 0;
}
