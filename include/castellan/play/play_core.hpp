#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "../model/game_result.hpp"
#include "../model/history.hpp"
#include "../model/move.hpp"
#include "../model/move_state.hpp"
#include "../model/position.hpp"
#include "../model/rules_config.hpp"
#include "board.hpp"
#include "config.hpp"

namespace castellan::play::detail {

/// Game bookkeeping shared by both board modes: current derived state, history and
/// result. Every mutating call either succeeds completely or leaves the object as it was.
class PlayCore {
 public:
  // Throws PlayException (InvalidPosition) if 'start' is not a legal position.
  PlayCore(const model::Position& start, const model::RulesConfig& rules);

  [[nodiscard]] const model::Position& position() const noexcept { return m_state.position(); }
  [[nodiscard]] const model::MoveState& moveState() const noexcept { return m_state; }
  [[nodiscard]] const model::History& history() const noexcept { return m_history; }
  [[nodiscard]] const model::RulesConfig& rules() const noexcept { return m_rules; }
  [[nodiscard]] const std::optional<model::GameResult>& result() const noexcept {
    return m_result;
  }
  [[nodiscard]] bool isTerminal() const noexcept { return m_result.has_value(); }

  [[nodiscard]] std::vector<model::LegalMove> legalMoves() const;
  [[nodiscard]] std::optional<model::LegalMove> resolve(const model::Move& m) const;

  MoveResult apply(const model::Move& m);
  std::optional<PlayError> setResult(const model::GameResult& r) noexcept;

  // Applies 'moves' in order. Throws PlayException carrying the index of the first
  // move that is rejected.
  void replay(const std::vector<model::Move>& moves);

 private:
  model::RulesConfig m_rules;
  model::History m_history;
  model::MoveState m_state;
  std::optional<model::GameResult> m_result;
};

[[nodiscard]] model::Position start_position(const GameConfig& cfg);

}  // namespace castellan::play::detail
