#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "../chess_types.hpp"
#include "board.hpp"
#include "history.hpp"
#include "move_state.hpp"
#include "rules_config.hpp"

namespace castellan::model {

enum class WinReason : std::uint8_t { CheckMate, TimeExpired, Resigned, Abandoned };
enum class DrawReason : std::uint8_t { Agreed, StaleMate, Repetition, FiftyMoves, Insufficient };

/// Terminal outcome of a game: a win for one color or a draw.
class GameResult {
 public:
  [[nodiscard]] static GameResult win(core::Color winner, WinReason reason) noexcept {
    GameResult r;
    r.m_draw = false;
    r.m_winner = winner;
    r.m_win = reason;
    return r;
  }
  [[nodiscard]] static GameResult draw(DrawReason reason) noexcept {
    GameResult r;
    r.m_draw = true;
    r.m_drawReason = reason;
    return r;
  }

  [[nodiscard]] bool isWin() const noexcept { return !m_draw; }
  [[nodiscard]] bool isDraw() const noexcept { return m_draw; }
  // Only meaningful for wins / draws respectively.
  [[nodiscard]] core::Color winner() const noexcept { return m_winner; }
  [[nodiscard]] WinReason winReason() const noexcept { return m_win; }
  [[nodiscard]] DrawReason drawReason() const noexcept { return m_drawReason; }

  friend bool operator==(const GameResult& a, const GameResult& b) noexcept {
    if (a.m_draw != b.m_draw) return false;
    if (a.m_draw) return a.m_drawReason == b.m_drawReason;
    return a.m_winner == b.m_winner && a.m_win == b.m_win;
  }

 private:
  GameResult() = default;

  bool m_draw = true;
  core::Color m_winner = core::Color::White;
  WinReason m_win = WinReason::CheckMate;
  DrawReason m_drawReason = DrawReason::Agreed;
};

[[nodiscard]] const char* to_string(WinReason r) noexcept;
[[nodiscard]] const char* to_string(DrawReason r) noexcept;
[[nodiscard]] std::string to_string(const GameResult& r);

// Simplified dead-material test: K v K, K+minor v K, and K+B v K+B with both bishops on
// the same square color. Anything with a pawn, rook, queen or two minors on one side is
// considered playable even where a mate is in fact impossible.
[[nodiscard]] bool has_insufficient_material(const Board& b) noexcept;

// Result of the position at the end of 'history' (ms must describe that position), first
// match wins: checkmate, stalemate, repetition, fifty-move rule, insufficient material.
[[nodiscard]] std::optional<GameResult> detect_result(const MoveState& ms, const History& history,
                                                      const RulesConfig& rules = {});

}  // namespace castellan::model
