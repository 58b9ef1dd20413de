#pragma once
#include <optional>
#include <vector>

#include "board.hpp"
#include "config.hpp"
#include "play_core.hpp"

namespace castellan::play {

/// Authoritative game: accepts moves for both sides and decides the result.
template <>
class Board<EngineMode> {
 public:
  explicit Board(const GameConfig& cfg = {});
  // Throws PlayException (InvalidPosition) if 'start' is not a legal position.
  Board(const model::Position& start, const model::RulesConfig& rules = {});

  // Rebuilds a game from its move list. Throws PlayException at the first rejected move.
  [[nodiscard]] static Board replay(const GameConfig& cfg, const std::vector<model::Move>& moves);
  [[nodiscard]] static Board replay(const model::Position& start, const model::RulesConfig& rules,
                                    const std::vector<model::Move>& moves);

  MoveResult apply(const model::Move& m);

  std::optional<PlayError> resign(core::Color loser) noexcept;
  std::optional<PlayError> agreeDraw() noexcept;
  // External decisions such as a flag fall or an abandoned game.
  std::optional<PlayError> declareResult(const model::GameResult& r) noexcept;

  [[nodiscard]] std::vector<model::LegalMove> legalMoves() const { return m_core.legalMoves(); }
  [[nodiscard]] bool isLegal(const model::Move& m) const {
    return !m_core.isTerminal() && m_core.resolve(m).has_value();
  }

  [[nodiscard]] const model::Position& position() const noexcept { return m_core.position(); }
  [[nodiscard]] core::Color sideToMove() const noexcept { return position().sideToMove(); }
  [[nodiscard]] bool inCheck() const noexcept { return m_core.moveState().isCheck(); }
  [[nodiscard]] const model::History& history() const noexcept { return m_core.history(); }
  [[nodiscard]] const std::optional<model::GameResult>& result() const noexcept {
    return m_core.result();
  }
  [[nodiscard]] bool isTerminal() const noexcept { return m_core.isTerminal(); }

 private:
  detail::PlayCore m_core;
};

using EngineBoard = Board<EngineMode>;

}  // namespace castellan::play
