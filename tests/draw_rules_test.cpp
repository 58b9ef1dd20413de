#include <cassert>
#include <string>
#include <vector>

#include "castellan/model/fen.hpp"
#include "castellan/model/game_result.hpp"
#include "castellan/model/history.hpp"
#include "castellan/model/move_generator.hpp"
#include "castellan/model/move_state.hpp"
#include "castellan/play/engine_board.hpp"

using namespace castellan;
using namespace castellan::model;
using play::EngineBoard;

static Move mv(const char* text)
{
  const auto m = parse_move(text);
  assert(m);
  return *m;
}

static bool insufficient(const char* fenText)
{
  return has_insufficient_material(fen::parse(fenText).getBoard());
}

int main()
{
  // Threefold repetition triggers on the third occurrence, not before
  {
    EngineBoard board;
    const std::vector<const char*> shuffle = {"g1f3", "g8f6", "f3g1", "f6g8"};
    for (int round = 0; round < 2; ++round)
    {
      for (const char* m : shuffle)
      {
        assert(!board.result());
        const auto r = board.apply(mv(m));
        assert(r.ok());
      }
    }
    assert(board.history().plyCount() == 8);
    assert(board.history().currentRepetitions() == 3);
    assert(board.result());
    assert(*board.result() == GameResult::draw(DrawReason::Repetition));

    const auto late = board.apply(mv("e2e4"));
    assert(!late.ok() && *late.error == play::PlayError::GameAlreadyTerminal);
    assert(board.history().plyCount() == 8);
  }

  // Two occurrences are not enough, and the limit is configurable
  {
    RulesConfig rules;
    rules.repetitionLimit = 2;
    EngineBoard board(play::GameConfig{BackRankId::standard(), rules});
    for (const char* m : {"g1f3", "g8f6", "f3g1"})
      assert(board.apply(mv(m)).ok() && !board.result());
    assert(board.apply(mv("f6g8")).ok());
    assert(board.result() && board.result()->drawReason() == DrawReason::Repetition);

    rules.threefoldRepetition = false;
    EngineBoard off(play::GameConfig{BackRankId::standard(), rules});
    for (int i = 0; i < 3; ++i)
      for (const char* m : {"g1f3", "g8f6", "f3g1", "f6g8"})
        assert(off.apply(mv(m)).ok());
    assert(!off.result());
  }

  // The en passant target is part of the repetition key
  {
    const Position withEp = fen::parse("4k3/8/8/8/3pP3/8/8/4K3 b - e3 0 1");
    const Position withoutEp = fen::parse("4k3/8/8/8/3pP3/8/8/4K3 b - - 0 1");
    assert(!(withEp.key() == withoutEp.key()));
    assert(withEp.key() == fen::parse("4k3/8/8/8/3pP3/8/8/4K3 b - e3 7 30").key());

    History h(withoutEp);
    assert(h.repetitions(withEp.key()) == 0);
    assert(h.repetitions(withoutEp.key()) == 1);
  }

  // A pawn move or capture closes off every earlier position
  {
    EngineBoard board;
    for (const char* m : {"g1f3", "g8f6", "f3g1", "f6g8"})
      assert(board.apply(mv(m)).ok());
    assert(board.history().currentRepetitions() == 2);

    assert(board.apply(mv("e2e3")).ok());
    assert(board.history().repetitions(board.history().initial().key()) == 0);
    assert(board.history().currentRepetitions() == 1);

    for (int round = 0; round < 2; ++round)
      for (const char* m : {"g8f6", "g1f3", "f6g8", "f3g1"})
        assert(board.apply(mv(m)).ok());
    assert(board.history().currentRepetitions() == 3);
    assert(board.result() && board.result()->drawReason() == DrawReason::Repetition);

    History h(Position::start(BackRankId::standard()));
    const auto e4 = MoveGenerator{}.validate(MoveState(h.current()), mv("e2e4"));
    assert(e4);
    h.push(*e4, h.current().apply(*e4));
    assert(h.repetitions(h.initial().key()) == 0);
    h.pop();
    assert(h.plyCount() == 0);
    assert(h.repetitions(h.initial().key()) == 1);
  }

  // Fifty-move rule at 100 plies; a pawn move or capture resets the clock
  {
    EngineBoard board(fen::parse("4k3/8/8/8/8/8/4P3/R3K3 w - - 98 80"));
    assert(board.apply(mv("a1a2")).ok());
    assert(board.position().halfmoveClock() == 99);
    assert(!board.result());
    assert(board.apply(mv("e8d8")).ok());
    assert(board.position().halfmoveClock() == 100);
    assert(board.result() && *board.result() == GameResult::draw(DrawReason::FiftyMoves));

    EngineBoard reset(fen::parse("4k3/8/8/8/8/8/4P3/R3K3 w - - 98 80"));
    assert(reset.apply(mv("e2e4")).ok());
    assert(reset.position().halfmoveClock() == 0);
    assert(reset.apply(mv("e8d8")).ok());
    assert(reset.position().halfmoveClock() == 1);
    assert(!reset.result());

    EngineBoard capture(fen::parse("3nk3/8/8/8/8/8/8/R2RK3 w - - 99 80"));
    assert(capture.apply(mv("d1d8")).ok());
    assert(capture.position().halfmoveClock() == 0);
    assert(!capture.result());
  }

  // With the rule off the clock saturates instead of wrapping
  {
    RulesConfig rules;
    rules.fiftyMoveRule = false;
    EngineBoard board(fen::parse("4k3/8/8/8/8/8/4P3/R3K3 w - - 65534 900"), rules);
    assert(board.apply(mv("a1a2")).ok());
    assert(board.position().halfmoveClock() == 65535);
    assert(board.apply(mv("e8d8")).ok());
    assert(board.position().halfmoveClock() == 65535);
    assert(board.apply(mv("a2a1")).ok());
    assert(board.position().halfmoveClock() == 65535);
    assert(!board.result());
    assert(fen::write(board.position()) == "3k4/8/8/8/8/8/4P3/R3K3 b - - 65535 901");
  }

  // Insufficient material heuristic
  {
    assert(insufficient("4k3/8/8/8/8/8/8/4K3 w - - 0 1"));
    assert(insufficient("4k3/8/8/8/8/8/8/1N2K3 w - - 0 1"));
    assert(insufficient("4k3/8/8/8/8/8/8/2B1K3 w - - 0 1"));
    assert(insufficient("4kb2/8/8/8/8/8/8/2B1K3 w - - 0 1"));
    assert(!insufficient("2b1k3/8/8/8/8/8/8/2B1K3 w - - 0 1"));
    assert(!insufficient("4k3/8/8/8/8/8/8/R3K3 w - - 0 1"));
    assert(!insufficient("4k3/8/8/8/8/8/8/1NN1K3 w - - 0 1"));
    assert(!insufficient("1n2k3/8/8/8/8/8/8/1N2K3 w - - 0 1"));
    assert(!insufficient("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1"));
    assert(!insufficient("4k3/8/8/8/8/8/8/3QK3 w - - 0 1"));
  }

  // Capturing into a dead position ends the game; the rule can be switched off
  {
    EngineBoard board(fen::parse("4k3/8/8/8/8/8/3q4/4K3 w - - 0 1"));
    assert(board.inCheck());
    assert(board.apply(mv("e1d2")).ok());
    assert(board.result() && board.result()->drawReason() == DrawReason::Insufficient);

    RulesConfig rules;
    rules.insufficientMaterial = false;
    EngineBoard off(fen::parse("4k3/8/8/8/8/8/3q4/4K3 w - - 0 1"), rules);
    assert(off.apply(mv("e1d2")).ok());
    assert(!off.result());

    // A position that starts dead is terminal from the outset
    EngineBoard dead(fen::parse("4k3/8/8/8/8/8/8/4K3 w - - 0 1"));
    assert(dead.isTerminal());
    assert(dead.legalMoves().empty());
  }

  // Checkmate beats every draw rule, stalemate is a draw
  {
    EngineBoard mate;
    for (const char* m : {"f2f3", "e7e5", "g2g4", "d8h4"})
      assert(mate.apply(mv(m)).ok());
    assert(mate.result());
    assert(*mate.result() == GameResult::win(core::Color::Black, WinReason::CheckMate));
    assert(to_string(*mate.result()) == "black wins by checkmate");

    EngineBoard lateMate(fen::parse("6k1/5ppp/8/8/8/8/8/R5K1 w - - 99 80"));
    assert(lateMate.apply(mv("a1a8")).ok());
    assert(lateMate.position().halfmoveClock() == 100);
    assert(lateMate.result()->isWin());

    EngineBoard stale(fen::parse("7k/5Q2/8/6K1/8/8/8/8 w - - 0 1"));
    assert(stale.apply(mv("g5g6")).ok());
    assert(stale.result() && *stale.result() == GameResult::draw(DrawReason::StaleMate));
    assert(to_string(*stale.result()) == "draw by stalemate");
  }

  // The detector can be driven directly from a history
  {
    const Position p = fen::parse("4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    History h(p);
    RulesConfig rules;
    assert(detect_result(MoveState(p), h, rules) == GameResult::draw(DrawReason::Insufficient));
    rules.insufficientMaterial = false;
    assert(!detect_result(MoveState(p), h, rules));
  }

  return 0;
}
