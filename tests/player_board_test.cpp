#include <cassert>
#include <string>
#include <vector>

#include "castellan/model/fen.hpp"
#include "castellan/play/engine_board.hpp"
#include "castellan/play/player_board.hpp"

using namespace castellan;
using namespace castellan::model;
using core::Color;
using play::PlayError;
using play::PlayerBoard;
using play::PreMoveStatus;
using PT = core::PieceType;

static core::Square sq(char file, int rank)
{
  int f = file - 'a';
  int r = rank - 1;
  return static_cast<core::Square>(r * 8 + f);
}

static Move mv(const char* text)
{
  const auto m = parse_move(text);
  assert(m);
  return *m;
}

int main()
{
  // A pre-move that survives the reply is played at once
  {
    PlayerBoard black(Color::Black);
    assert(!black.isOurTurn());

    const auto queued = black.submitOurMove(mv("e7e5"));
    assert(queued.ok() && queued.preMove == PreMoveStatus::Queued);
    assert(black.pendingPreMove());
    assert(black.history().plyCount() == 0);

    const Position shown = black.preview();
    assert(shown.pieceAt(sq('e', 5)) == (bb::Piece{PT::Pawn, Color::Black}));
    assert(!shown.pieceAt(sq('e', 7)));
    assert(black.position() == Position::start(BackRankId::standard()));

    const auto r = black.submitTheirMove(mv("e2e4"));
    assert(r.ok());
    assert(r.preMove == PreMoveStatus::Applied);
    assert(r.preMoveApplied && r.preMoveApplied->toMove() == mv("e7e5"));
    assert(!black.pendingPreMove());
    assert(black.history().plyCount() == 2);
    assert(black.position().sideToMove() == Color::White);
    assert(black.position().pieceAt(sq('e', 5)) == (bb::Piece{PT::Pawn, Color::Black}));

    // Same game as the authoritative board would have
    play::EngineBoard engine;
    assert(engine.apply(mv("e2e4")).ok());
    assert(engine.apply(mv("e7e5")).ok());
    assert(engine.position() == black.position());
  }

  // A pre-move made impossible by the reply is dropped
  {
    PlayerBoard black(Color::Black, fen::parse("4k3/p7/8/8/8/8/3r4/4K3 w - - 0 1"));
    assert(black.submitOurMove(mv("d2d5")).preMove == PreMoveStatus::Queued);

    const auto r = black.submitTheirMove(mv("e1d2"));
    assert(r.ok());
    assert(r.preMove == PreMoveStatus::Discarded);
    assert(!r.preMoveApplied);
    assert(!black.pendingPreMove());
    assert(black.isOurTurn());
    assert(black.history().plyCount() == 1);
    assert(!black.result());

    // The reply blocks the pawn in one game and not in the other
    const Position start = fen::parse("4k3/8/8/8/8/7r/4P3/4K3 b - - 0 1");
    PlayerBoard white(Color::White, start);
    assert(white.submitOurMove(mv("e2e4")).ok());
    const auto unblocked = white.submitTheirMove(mv("h3h4"));
    assert(unblocked.ok() && unblocked.preMove == PreMoveStatus::Applied);
    assert(white.position().pieceAt(sq('e', 4)) == (bb::Piece{PT::Pawn, Color::White}));

    PlayerBoard white2(Color::White, start);
    assert(white2.submitOurMove(mv("e2e4")).ok());
    const auto blocked = white2.submitTheirMove(mv("h3e3"));
    assert(blocked.ok() && blocked.preMove == PreMoveStatus::Discarded);
    assert(white2.position().pieceAt(sq('e', 2)) == (bb::Piece{PT::Pawn, Color::White}));
    assert(white2.isOurTurn());
  }

  // Structural checks on pre-moves
  {
    PlayerBoard black(Color::Black);
    auto r = black.submitOurMove(mv("b8b6"));
    assert(!r.ok() && *r.error == PlayError::IllegalMove);
    r = black.submitOurMove(mv("e2e4"));
    assert(!r.ok() && *r.error == PlayError::IllegalMove);
    r = black.submitOurMove(mv("e7e8q"));
    assert(!r.ok());
    assert(!black.pendingPreMove());

    // Occupancy is ignored: the rook may pre-move through its own pawn
    r = black.submitOurMove(mv("a8a3"));
    assert(r.ok() && r.preMove == PreMoveStatus::Queued);
    assert(black.moveDestinations(sq('a', 8)) & bb::sq_bb(sq('a', 1)));
    assert(black.moveDestinations(sq('b', 8)) ==
           (bb::sq_bb(sq('a', 6)) | bb::sq_bb(sq('c', 6)) | bb::sq_bb(sq('d', 7))));

    // A new pre-move replaces the old one; cancel clears it
    assert(black.submitOurMove(mv("g8f6")).ok());
    assert(black.pendingPreMove()->toMove() == mv("g8f6"));
    black.cancelPreMove();
    assert(!black.pendingPreMove());
    assert(black.preview() == black.position());

    const auto reply = black.submitTheirMove(mv("d2d4"));
    assert(reply.ok() && reply.preMove == PreMoveStatus::None);
    assert(black.isOurTurn());

    // On our turn moves are played directly and destinations are the legal ones
    assert(black.moveDestinations(sq('a', 8)) == 0);
    assert(black.moveDestinations(sq('g', 8)) == (bb::sq_bb(sq('f', 6)) | bb::sq_bb(sq('h', 6))));
    const auto wrongTurn = black.submitTheirMove(mv("e2e4"));
    assert(!wrongTurn.ok() && *wrongTurn.error == PlayError::IllegalMove);
    const auto own = black.submitOurMove(mv("d7d5"));
    assert(own.ok() && own.preMove == PreMoveStatus::None);
    assert(!black.isOurTurn());
  }

  // A rejected opponent move keeps the pending pre-move
  {
    PlayerBoard black(Color::Black);
    assert(black.submitOurMove(mv("e7e5")).ok());
    const auto bad = black.submitTheirMove(mv("e2e5"));
    assert(!bad.ok() && *bad.error == PlayError::IllegalMove);
    assert(black.pendingPreMove());
    assert(black.history().plyCount() == 0);
  }

  // Castling as a pre-move
  {
    PlayerBoard white(Color::White, fen::parse("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R b KQkq - 0 1"));
    const auto q = white.submitOurMove(mv("e1g1"));
    assert(q.ok() && white.pendingPreMove()->isCastle());
    assert(white.preview().pieceAt(sq('g', 1)) == (bb::Piece{PT::King, Color::White}));
    assert(white.preview().pieceAt(sq('f', 1)) == (bb::Piece{PT::Rook, Color::White}));

    const auto r = white.submitTheirMove(mv("a7a6"));
    assert(r.preMove == PreMoveStatus::Applied && r.preMoveApplied->isCastle());
    assert(white.position().pieceAt(sq('g', 1)) == (bb::Piece{PT::King, Color::White}));
  }

  // The game ending on the reply drops the pre-move
  {
    PlayerBoard white(Color::White, fen::parse("rnbqkbnr/pppp1ppp/8/4p3/6P1/5P2/PPPPP2P/RNBQKBNR b KQkq - 0 2"));
    assert(white.submitOurMove(mv("a2a3")).ok());
    const auto r = white.submitTheirMove(mv("d8h4"));
    assert(r.ok() && r.preMove == PreMoveStatus::Discarded);
    assert(white.isTerminal());
    assert(white.result()->winReason() == WinReason::CheckMate);
    assert(white.submitOurMove(mv("a2a3")).error == PlayError::GameAlreadyTerminal);
    assert(white.moveDestinations(sq('a', 2)) == 0);
  }

  // Replay leaves no pre-move behind; results from the server are recorded
  {
    const std::vector<Move> game = {mv("e2e4"), mv("c7c5"), mv("g1f3")};
    PlayerBoard black = PlayerBoard::replay(Color::Black, play::GameConfig{}, game);
    assert(black.isOurTurn());
    assert(!black.pendingPreMove());
    assert(black.history().plyCount() == 3);

    assert(black.submitOurMove(mv("d7d6")).preMove == PreMoveStatus::None);
    assert(black.submitOurMove(mv("g8f6")).preMove == PreMoveStatus::Queued);
    assert(!black.declareResult(GameResult::win(Color::White, WinReason::TimeExpired)));
    assert(!black.pendingPreMove());
    assert(black.declareResult(GameResult::draw(DrawReason::Agreed)) ==
           PlayError::GameAlreadyTerminal);
  }

  // A malformed start is refused with InvalidPosition
  {
    bool threw = false;
    try
    {
      PlayerBoard board(Color::White, Position{});
    }
    catch (const play::PlayException& e)
    {
      threw = true;
      assert(e.error() == PlayError::InvalidPosition);
    }
    assert(threw);
  }

  return 0;
}
