#pragma once
#include <array>
#include <cstdint>

#include "bitboard.hpp"
#include "model_types.hpp"

namespace castellan::model::geometry {

// Ray directions. The first four increase the square index, the last four decrease it.
// Direction d and (d + 4) % 8 are opposite.
enum class Direction : std::uint8_t {
  North,
  East,
  NorthEast,
  NorthWest,
  South,
  West,
  SouthWest,
  SouthEast
};

inline constexpr int NUM_DIRECTIONS = 8;

[[nodiscard]] constexpr bool is_diagonal(Direction d) noexcept {
  return d == Direction::NorthEast || d == Direction::NorthWest || d == Direction::SouthEast ||
         d == Direction::SouthWest;
}

struct Tables {
  // rays[dir][sq]: every square from sq (exclusive) to the board edge.
  std::array<std::array<bb::Bitboard, 64>, NUM_DIRECTIONS> rays{};
  // between[a][b]: squares strictly between a and b, 0 when not aligned.
  std::array<std::array<bb::Bitboard, 64>, 64> between{};
  // line[a][b]: the full edge-to-edge line through a and b, 0 when not aligned.
  std::array<std::array<bb::Bitboard, 64>, 64> line{};
  // Empty-board reach of bishops and rooks.
  std::array<bb::Bitboard, 64> bishopReach{};
  std::array<bb::Bitboard, 64> rookReach{};
};

// Built on first use, immutable afterwards. Safe to call from any thread.
const Tables& tables() noexcept;

// Optional eager initialization (e.g. at process start-up).
void init_geometry() noexcept;

[[nodiscard]] inline bb::Bitboard between(core::Square a, core::Square b) noexcept {
  return tables().between[a][b];
}
[[nodiscard]] inline bb::Bitboard line(core::Square a, core::Square b) noexcept {
  return tables().line[a][b];
}
[[nodiscard]] inline bool aligned(core::Square a, core::Square b) noexcept {
  return tables().line[a][b] != 0;
}
[[nodiscard]] inline bool aligned(core::Square a, core::Square b, core::Square c) noexcept {
  return (tables().line[a][b] & bb::sq_bb(c)) != 0;
}

// Ray cast: the ray stops at (and includes) the first occupied square.
[[nodiscard]] bb::Bitboard ray_attacks(Direction d, core::Square s, bb::Bitboard occ) noexcept;

[[nodiscard]] bb::Bitboard bishop_attacks(core::Square s, bb::Bitboard occ) noexcept;
[[nodiscard]] bb::Bitboard rook_attacks(core::Square s, bb::Bitboard occ) noexcept;
[[nodiscard]] inline bb::Bitboard queen_attacks(core::Square s, bb::Bitboard occ) noexcept {
  return bishop_attacks(s, occ) | rook_attacks(s, occ);
}

// Attack set of a non-pawn piece kind on square s for the given occupancy.
[[nodiscard]] bb::Bitboard piece_attacks(core::PieceType pt, core::Square s,
                                         bb::Bitboard occ) noexcept;

}  // namespace castellan::model::geometry
