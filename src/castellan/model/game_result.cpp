#include "castellan/model/game_result.hpp"

#include "castellan/model/move_generator.hpp"

namespace castellan::model {

using core::Color;
using PT = core::PieceType;

const char* to_string(WinReason r) noexcept {
  switch (r) {
    case WinReason::CheckMate:
      return "checkmate";
    case WinReason::TimeExpired:
      return "time expired";
    case WinReason::Resigned:
      return "resignation";
    case WinReason::Abandoned:
      return "abandoned";
  }
  return "?";
}

const char* to_string(DrawReason r) noexcept {
  switch (r) {
    case DrawReason::Agreed:
      return "agreement";
    case DrawReason::StaleMate:
      return "stalemate";
    case DrawReason::Repetition:
      return "threefold repetition";
    case DrawReason::FiftyMoves:
      return "fifty-move rule";
    case DrawReason::Insufficient:
      return "insufficient material";
  }
  return "?";
}

std::string to_string(const GameResult& r) {
  if (r.isDraw()) return std::string("draw by ") + to_string(r.drawReason());
  return std::string(core::to_string(r.winner())) + " wins by " + to_string(r.winReason());
}

bool has_insufficient_material(const Board& b) noexcept {
  if (b.getPieces(PT::Pawn) | b.getPieces(PT::Rook) | b.getPieces(PT::Queen)) return false;

  const bb::Bitboard wMinors = b.getPieces(Color::White, PT::Knight) |
                               b.getPieces(Color::White, PT::Bishop);
  const bb::Bitboard bMinors = b.getPieces(Color::Black, PT::Knight) |
                               b.getPieces(Color::Black, PT::Bishop);
  const int w = bb::popcount(wMinors);
  const int bl = bb::popcount(bMinors);

  if (w + bl <= 1) return true;  // KK, KNK, KBK
  if (w == 1 && bl == 1) {
    const bb::Bitboard bishops = b.getPieces(PT::Bishop);
    if (bb::popcount(bishops) != 2) return false;
    return (bishops & bb::LIGHT_SQUARES) == 0ULL || (bishops & bb::DARK_SQUARES) == 0ULL;
  }
  return false;
}

std::optional<GameResult> detect_result(const MoveState& ms, const History& history,
                                        const RulesConfig& rules) {
  if (!MoveGenerator{}.hasLegalMove(ms)) {
    if (ms.isCheck()) return GameResult::win(~ms.us(), WinReason::CheckMate);
    return GameResult::draw(DrawReason::StaleMate);
  }

  const Position& pos = ms.position();
  if (rules.threefoldRepetition && history.repetitions(pos.key()) >= rules.repetitionLimit)
    return GameResult::draw(DrawReason::Repetition);
  if (rules.fiftyMoveRule && pos.halfmoveClock() >= rules.fiftyMovePlies)
    return GameResult::draw(DrawReason::FiftyMoves);
  if (rules.insufficientMaterial && has_insufficient_material(pos.getBoard()))
    return GameResult::draw(DrawReason::Insufficient);
  return std::nullopt;
}

}  // namespace castellan::model
