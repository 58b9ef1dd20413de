#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/bitboard.hpp"
#include "core/model_types.hpp"

namespace castellan::model {

namespace detail {

// Assumes core::PieceType values map to [0..6] where 6 is None.
inline constexpr std::int8_t kTypeIndex[7] = {0, 1, 2, 3, 4, 5, -1};

CASTELLAN_ALWAYS_INLINE constexpr int type_index(core::PieceType t) noexcept {
  return kTypeIndex[static_cast<int>(t)];
}

CASTELLAN_ALWAYS_INLINE constexpr int decode_ti(std::uint8_t packed) noexcept {
  return (packed & 0x7) - 1;
}
CASTELLAN_ALWAYS_INLINE constexpr int decode_ci(std::uint8_t packed) noexcept {
  return (packed >> 3) & 0x1;
}

}  // namespace detail

/// Piece placement: one mask per (color, kind) plus a square -> piece lookup.
/// The masks of different pieces never overlap.
class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    for (auto& byColor : m_bb) byColor.fill(0);
    m_color_occ = {0, 0};
    m_all_occ = 0;
    m_piece_on.fill(0);
  }

  CASTELLAN_ALWAYS_INLINE void setPiece(core::Square sq, bb::Piece p) noexcept;
  CASTELLAN_ALWAYS_INLINE void removePiece(core::Square sq) noexcept;
  CASTELLAN_ALWAYS_INLINE void movePiece(core::Square from, core::Square to) noexcept;

  [[nodiscard]] std::optional<bb::Piece> getPiece(core::Square sq) const noexcept {
    const std::uint8_t packed = m_piece_on[sq];
    if (!packed) return std::nullopt;
    return unpack_piece(packed);
  }
  [[nodiscard]] bool isEmpty(core::Square sq) const noexcept { return m_piece_on[sq] == 0; }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  [[nodiscard]] bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    const int ti = detail::type_index(t);
    if (ti < 0) return 0;
    return m_bb[bb::ci(c)][ti];
  }
  [[nodiscard]] bb::Bitboard getPieces(core::PieceType t) const noexcept {
    return getPieces(core::Color::White, t) | getPieces(core::Color::Black, t);
  }

  // NO_SQUARE if the side has no king (only possible while a setup is being validated).
  [[nodiscard]] core::Square kingSquare(core::Color c) const noexcept {
    const bb::Bitboard k = getPieces(c, core::PieceType::King);
    return k ? bb::lsb(k) : core::NO_SQUARE;
  }

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_piece_on == b.m_piece_on;
  }

 private:
  // [color][typeIndex 0..5]
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;

  // O(1) per square (0 = empty, else (ptIdx+1) | (color<<3))
  std::array<std::uint8_t, 64> m_piece_on{};

  static constexpr std::uint8_t pack_piece(bb::Piece p) noexcept {
    if (p.type == core::PieceType::None) return 0;
    const int ti = detail::type_index(p.type);
    const std::uint8_t c = static_cast<std::uint8_t>(bb::ci(p.color) & 1u);
    return static_cast<std::uint8_t>((ti + 1) | (c << 3));
  }
  static constexpr bb::Piece unpack_piece(std::uint8_t pp) noexcept {
    const core::PieceType pt = static_cast<core::PieceType>(detail::decode_ti(pp));
    const core::Color col = detail::decode_ci(pp) ? core::Color::Black : core::Color::White;
    return bb::Piece{pt, col};
  }
};

CASTELLAN_ALWAYS_INLINE void Board::setPiece(core::Square sq, bb::Piece p) noexcept {
  removePiece(sq);
  const std::uint8_t packed = pack_piece(p);
  if (!packed) return;

  const bb::Bitboard mask = bb::sq_bb(sq);
  const int ti = detail::type_index(p.type);
  const int ci = bb::ci(p.color);
  m_bb[ci][ti] |= mask;
  m_color_occ[ci] |= mask;
  m_all_occ |= mask;
  m_piece_on[sq] = packed;
}

CASTELLAN_ALWAYS_INLINE void Board::removePiece(core::Square sq) noexcept {
  const std::uint8_t packed = m_piece_on[sq];
  if (!packed) return;

  const int ti = detail::decode_ti(packed);
  const int ci = detail::decode_ci(packed);
  const bb::Bitboard mask = bb::sq_bb(sq);

  m_bb[ci][ti] &= ~mask;
  m_color_occ[ci] &= ~mask;
  m_all_occ &= ~mask;
  m_piece_on[sq] = 0;
}

// Moves whatever stands on 'from' to 'to', replacing any piece on 'to'.
CASTELLAN_ALWAYS_INLINE void Board::movePiece(core::Square from, core::Square to) noexcept {
  const std::uint8_t packed = m_piece_on[from];
  if (!packed || from == to) return;
  removePiece(to);

  const int ti = detail::decode_ti(packed);
  const int ci = detail::decode_ci(packed);
  const bb::Bitboard flip = bb::sq_bb(from) | bb::sq_bb(to);

  m_bb[ci][ti] ^= flip;
  m_color_occ[ci] ^= flip;
  m_all_occ ^= flip;
  m_piece_on[from] = 0;
  m_piece_on[to] = packed;
}

}  // namespace castellan::model
