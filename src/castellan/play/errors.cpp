#include "castellan/play/board.hpp"
#include "castellan/play/errors.hpp"

namespace castellan::play {

const char* to_string(PlayError e) noexcept {
  switch (e) {
    case PlayError::IllegalMove:
      return "illegal_move";
    case PlayError::InvalidPosition:
      return "invalid_position";
    case PlayError::GameAlreadyTerminal:
      return "game_already_terminal";
  }
  return "unknown";
}

const char* to_string(PreMoveStatus s) noexcept {
  switch (s) {
    case PreMoveStatus::None:
      return "none";
    case PreMoveStatus::Queued:
      return "queued";
    case PreMoveStatus::Applied:
      return "applied";
    case PreMoveStatus::Discarded:
      return "discarded";
  }
  return "unknown";
}

}  // namespace castellan::play
