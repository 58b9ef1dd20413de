#pragma once
#include <array>
#include <bit>
#include <cstdint>

#include "model_types.hpp"

#if defined(__clang__) || defined(__GNUC__)
#define CASTELLAN_ASSUME(x)            \
  do {                                 \
    if (!(x)) __builtin_unreachable(); \
  } while (0)
#elif defined(_MSC_VER)
#define CASTELLAN_ASSUME(x) __assume(x)
#else
#define CASTELLAN_ASSUME(x) ((void)0)
#endif

namespace castellan::model::bb {

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr bool more_than_one(Bitboard b) noexcept {
  return (b & (b - 1)) != 0;
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int popcount(Bitboard b) noexcept {
  return std::popcount(b);
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int ctz64(std::uint64_t x) noexcept {
  return static_cast<int>(std::countr_zero(x));
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr int clz64(std::uint64_t x) noexcept {
  return static_cast<int>(std::countl_zero(x));
}

// Caller guarantees b != 0
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr core::Square lsb(Bitboard b) noexcept {
  return static_cast<core::Square>(ctz64(b));
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr core::Square msb(Bitboard b) noexcept {
  return static_cast<core::Square>(63 - clz64(b));
}

// Hot-loop variant: caller guarantees b != 0
[[nodiscard]] CASTELLAN_ALWAYS_INLINE core::Square pop_lsb_unchecked(Bitboard& b) noexcept {
  CASTELLAN_ASSUME(b != 0);
  const int idx = ctz64(b);
  b &= (b - 1);
  return static_cast<core::Square>(idx);
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard north(Bitboard b) noexcept {
  return b << 8;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard south(Bitboard b) noexcept {
  return b >> 8;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard east(Bitboard b) noexcept {
  return (b & ~FILE_H) << 1;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard west(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 1;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard ne(Bitboard b) noexcept {
  return (b & ~FILE_H) << 9;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard nw(Bitboard b) noexcept {
  return (b & ~FILE_A) << 7;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard se(Bitboard b) noexcept {
  return (b & ~FILE_H) >> 7;
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard sw(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 9;
}

namespace detail {

constexpr Bitboard knight_from_sq(core::Square s) noexcept {
  Bitboard b = sq_bb(s);
  Bitboard l1 = (b & ~FILE_A) >> 1;
  Bitboard l2 = (b & ~(FILE_A | FILE_B)) >> 2;
  Bitboard r1 = (b & ~FILE_H) << 1;
  Bitboard r2 = (b & ~(FILE_H | FILE_G)) << 2;
  return (l2 << 8) | (l2 >> 8) | (r2 << 8) | (r2 >> 8) | (l1 << 16) | (l1 >> 16) | (r1 << 16) |
         (r1 >> 16);
}

constexpr Bitboard king_from_sq(core::Square s) noexcept {
  Bitboard b = sq_bb(s);
  return east(b) | west(b) | north(b) | south(b) | ne(b) | nw(b) | se(b) | sw(b);
}

constexpr auto build_knight_table() noexcept {
  std::array<Bitboard, 64> t{};
  for (int i = 0; i < 64; ++i) t[i] = knight_from_sq(static_cast<core::Square>(i));
  return t;
}

constexpr auto build_king_table() noexcept {
  std::array<Bitboard, 64> t{};
  for (int i = 0; i < 64; ++i) t[i] = king_from_sq(static_cast<core::Square>(i));
  return t;
}

inline constexpr auto KNIGHT_ATTACKS = build_knight_table();
inline constexpr auto KING_ATTACKS = build_king_table();

}  // namespace detail

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard knight_attacks_from(
    core::Square s) noexcept {
  return detail::KNIGHT_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard king_attacks_from(
    core::Square s) noexcept {
  return detail::KING_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard white_pawn_attacks(
    Bitboard pawns) noexcept {
  return nw(pawns) | ne(pawns);
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard black_pawn_attacks(
    Bitboard pawns) noexcept {
  return sw(pawns) | se(pawns);
}
[[nodiscard]] CASTELLAN_ALWAYS_INLINE constexpr Bitboard pawn_attacks(core::Color c,
                                                                      Bitboard pawns) noexcept {
  return c == core::Color::White ? white_pawn_attacks(pawns) : black_pawn_attacks(pawns);
}

}  // namespace castellan::model::bb
