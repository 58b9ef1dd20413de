#pragma once
#include <array>
#include <cstdint>

#include "../../chess_types.hpp"

#if defined(_MSC_VER)
#define CASTELLAN_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define CASTELLAN_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define CASTELLAN_ALWAYS_INLINE inline
#endif

namespace castellan::model::bb {

using Bitboard = std::uint64_t;

// Color-symmetric data is stored once per side and indexed with ci().
template <class T>
using ByColor = std::array<T, 2>;

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::White;
  [[nodiscard]] constexpr bool isNone() const noexcept { return type == core::PieceType::None; }
  friend constexpr bool operator==(const Piece&, const Piece&) noexcept = default;
};

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int ci(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 1;
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int file_of(core::Square s) noexcept {
  return s & 7;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int rank_of(core::Square s) noexcept {
  return s >> 3;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr core::Square make_square(int file,
                                                                         int rank) noexcept {
  return static_cast<core::Square>(rank * 8 + file);
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard sq_bb(core::Square s) noexcept {
  // Caller responsibility: s must be 0..63.
  return Bitboard{1} << static_cast<unsigned>(s);
}

// Rank index of the given side's back rank / pawn start rank / promotion rank.
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int back_rank(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 7;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int pawn_rank(core::Color c) noexcept {
  return c == core::Color::White ? 1 : 6;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int promotion_rank(core::Color c) noexcept {
  return c == core::Color::White ? 7 : 0;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int forward(core::Color c) noexcept {
  return c == core::Color::White ? 8 : -8;
}

constexpr Bitboard FILE_A = 0x0101010101010101ULL;
constexpr Bitboard FILE_B = 0x0202020202020202ULL;
constexpr Bitboard FILE_G = 0x4040404040404040ULL;
constexpr Bitboard FILE_H = 0x8080808080808080ULL;

constexpr Bitboard RANK_1 = 0x00000000000000FFULL;
constexpr Bitboard RANK_8 = 0xFF00000000000000ULL;

constexpr Bitboard LIGHT_SQUARES = 0x55AA55AA55AA55AAULL;
constexpr Bitboard DARK_SQUARES = ~LIGHT_SQUARES;

constexpr core::Square A1 = 0, E1 = 4, H1 = 7;
constexpr core::Square E8 = 60, H8 = 63;

}  // namespace castellan::model::bb
