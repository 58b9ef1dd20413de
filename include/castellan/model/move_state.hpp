#pragma once
#include <array>
#include <optional>

#include "core/bitboard.hpp"
#include "position.hpp"

namespace castellan::model {

// Pinned pieces of the side to move and the squares each may still reach.
struct PinInfo {
  bb::Bitboard pinned = 0ULL;
  std::array<bb::Bitboard, 64> allow{};  // only valid for squares flagged in 'pinned'

  void add(core::Square s, bb::Bitboard m) noexcept {
    pinned |= bb::sq_bb(s);
    allow[s] = m;
  }
  [[nodiscard]] bool isPinned(core::Square s) const noexcept {
    return (pinned & bb::sq_bb(s)) != 0;
  }
};

/// A position plus the attack data derived from it. Built once per position and
/// never modified afterwards.
class MoveState {
 public:
  explicit MoveState(const Position& pos);

  [[nodiscard]] const Position& position() const noexcept { return m_pos; }
  [[nodiscard]] const Board& board() const noexcept { return m_pos.getBoard(); }
  [[nodiscard]] core::Color us() const noexcept { return m_pos.sideToMove(); }
  [[nodiscard]] core::Square kingSquare() const noexcept { return m_king; }

  [[nodiscard]] bool isCheck() const noexcept { return m_checkers != 0; }
  [[nodiscard]] bool isDoubleCheck() const noexcept { return bb::more_than_one(m_checkers); }
  [[nodiscard]] bb::Bitboard checkers() const noexcept { return m_checkers; }

  // Squares a non-king move may land on: everything when not in check, the checker and
  // the squares between it and the king in single check, nothing in double check.
  [[nodiscard]] bb::Bitboard checkMask() const noexcept { return m_checkMask; }

  // Squares attacked by c. For the side not to move the mover's king is lifted off the
  // board, so squares behind it on a checking ray count as attacked.
  [[nodiscard]] bb::Bitboard attacked(core::Color c) const noexcept {
    return m_attacked[bb::ci(c)];
  }
  [[nodiscard]] bool isAttacked(core::Square sq) const noexcept {
    return (m_attacked[bb::ci(~us())] & bb::sq_bb(sq)) != 0;
  }

  [[nodiscard]] const PinInfo& pins() const noexcept { return m_pins; }
  [[nodiscard]] bool isPinned(core::Square sq) const noexcept { return m_pins.isPinned(sq); }
  // Ray a pinned piece may move along (pinner included), nullopt when not pinned.
  [[nodiscard]] std::optional<bb::Bitboard> pinRay(core::Square sq) const noexcept {
    if (!m_pins.isPinned(sq)) return std::nullopt;
    return m_pins.allow[sq];
  }

  [[nodiscard]] bool canCastle(CastleSide s) const noexcept;

 private:
  void computePins() noexcept;

  Position m_pos;
  core::Square m_king = core::NO_SQUARE;
  bb::ByColor<bb::Bitboard> m_attacked{};
  bb::Bitboard m_checkers = 0;
  bb::Bitboard m_checkMask = ~0ULL;
  PinInfo m_pins;
};

}  // namespace castellan::model
