#pragma once
#include <optional>
#include <vector>

#include "board.hpp"
#include "config.hpp"
#include "play_core.hpp"

namespace castellan::play {

/// Client-side game for one color. Our moves made during the opponent's turn are kept
/// as a single pending pre-move and tried again once the opponent's reply arrives.
template <>
class Board<PlayerMode> {
 public:
  explicit Board(core::Color us, const GameConfig& cfg = {});
  // Throws PlayException (InvalidPosition) if 'start' is not a legal position.
  Board(core::Color us, const model::Position& start, const model::RulesConfig& rules = {});

  // Throws PlayException at the first rejected move. No pre-move is pending afterwards.
  [[nodiscard]] static Board replay(core::Color us, const GameConfig& cfg,
                                    const std::vector<model::Move>& moves);
  [[nodiscard]] static Board replay(core::Color us, const model::Position& start,
                                    const model::RulesConfig& rules,
                                    const std::vector<model::Move>& moves);

  // Plays the move on our turn; otherwise stores it as the pending pre-move, replacing
  // any earlier one. A pre-move is only checked for reachability, not legality.
  MoveResult submitOurMove(const model::Move& m);
  // Confirmed opponent move, then the pending pre-move is played or dropped.
  MoveResult submitTheirMove(const model::Move& m);
  void cancelPreMove() noexcept { m_preMove.reset(); }

  [[nodiscard]] const std::optional<model::PreMove>& pendingPreMove() const noexcept {
    return m_preMove;
  }
  // Position to display: the current one with the pending pre-move's pieces moved.
  [[nodiscard]] model::Position preview() const noexcept;
  // Legal destinations on our turn, reachable squares for a pre-move otherwise.
  [[nodiscard]] model::bb::Bitboard moveDestinations(core::Square from) const;

  [[nodiscard]] core::Color us() const noexcept { return m_us; }
  [[nodiscard]] bool isOurTurn() const noexcept { return position().sideToMove() == m_us; }
  [[nodiscard]] std::vector<model::LegalMove> legalMoves() const { return m_core.legalMoves(); }

  [[nodiscard]] const model::Position& position() const noexcept { return m_core.position(); }
  [[nodiscard]] bool inCheck() const noexcept { return m_core.moveState().isCheck(); }
  [[nodiscard]] const model::History& history() const noexcept { return m_core.history(); }
  [[nodiscard]] const std::optional<model::GameResult>& result() const noexcept {
    return m_core.result();
  }
  [[nodiscard]] bool isTerminal() const noexcept { return m_core.isTerminal(); }

  // Results decided elsewhere (the server) are recorded here.
  std::optional<PlayError> declareResult(const model::GameResult& r) noexcept;

 private:
  core::Color m_us;
  detail::PlayCore m_core;
  std::optional<model::PreMove> m_preMove;
};

using PlayerBoard = Board<PlayerMode>;

}  // namespace castellan::play
