#pragma once
#include <compare>
#include <cstdint>
#include <type_traits>

#include "castling.hpp"
#include "core/model_types.hpp"

namespace castellan::model {

/// Ply counter. Even values are white to move, odd values black to move, so the
/// parity always matches the side to move.
class MoveId {
 public:
  constexpr MoveId() noexcept = default;
  constexpr explicit MoveId(std::uint32_t ply) noexcept : m_ply(ply) {}

  [[nodiscard]] static constexpr MoveId start() noexcept { return MoveId{0}; }
  [[nodiscard]] static constexpr MoveId fromFullmove(std::uint32_t fullmove,
                                                     core::Color turn) noexcept {
    return MoveId{2 * (fullmove == 0 ? 0 : fullmove - 1) + (turn == core::Color::Black ? 1u : 0u)};
  }

  [[nodiscard]] constexpr std::uint32_t value() const noexcept { return m_ply; }
  [[nodiscard]] constexpr core::Color turn() const noexcept {
    return (m_ply & 1u) ? core::Color::Black : core::Color::White;
  }
  [[nodiscard]] constexpr std::uint32_t fullmoveNumber() const noexcept { return m_ply / 2 + 1; }
  [[nodiscard]] constexpr MoveId next() const noexcept { return MoveId{m_ply + 1}; }
  [[nodiscard]] constexpr MoveId prev() const noexcept {
    return MoveId{m_ply == 0 ? 0 : m_ply - 1};
  }

  friend constexpr auto operator<=>(const MoveId&, const MoveId&) noexcept = default;

 private:
  std::uint32_t m_ply = 0;
};

struct GameState {
  MoveId moveId{};
  std::uint16_t halfmoveClock = 0;  // plies since the last pawn move or capture
  CastlingRights castling{};
  core::Square enPassantSquare = core::NO_SQUARE;

  [[nodiscard]] core::Color sideToMove() const noexcept { return moveId.turn(); }

  friend bool operator==(const GameState&, const GameState&) noexcept = default;
};

static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");
static_assert(sizeof(core::Color) <= 1, "core::Color should be 1 byte for compact state");
static_assert(sizeof(core::Square) <= 1, "core::Square should be 1 byte for compact state");

}  // namespace castellan::model
