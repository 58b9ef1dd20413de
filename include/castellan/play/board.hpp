#pragma once
#include <cstdint>
#include <optional>

#include "../model/game_state.hpp"
#include "../model/move.hpp"
#include "errors.hpp"

namespace castellan::play {

// Authoritative board: plays both sides and enforces every termination rule.
struct EngineMode {};
// Client board: plays one color, queues pre-moves while the opponent thinks.
struct PlayerMode {};

template <class Mode>
class Board;

enum class PreMoveStatus : std::uint8_t {
  None,       // no pre-move involved
  Queued,     // stored until the opponent has replied
  Applied,    // still legal after the reply and played automatically
  Discarded   // made illegal by the reply (or the game ended) and dropped
};

[[nodiscard]] const char* to_string(PreMoveStatus s) noexcept;

/// Outcome of a move submission. On error nothing on the board has changed.
struct MoveResult {
  std::optional<PlayError> error;
  model::LegalMove move{};    // the move that was played
  model::MoveId moveId{};     // ply of the position after it
  PreMoveStatus preMove = PreMoveStatus::None;
  std::optional<model::LegalMove> preMoveApplied;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] static MoveResult success(const model::LegalMove& m, model::MoveId id) noexcept {
    MoveResult r;
    r.move = m;
    r.moveId = id;
    return r;
  }
  [[nodiscard]] static MoveResult failure(PlayError e) noexcept {
    MoveResult r;
    r.error = e;
    return r;
  }
};

}  // namespace castellan::play
