#include "castellan/model/core/geometry.hpp"

namespace castellan::model::geometry {

namespace {

using core::Square;

constexpr int kFileStep[NUM_DIRECTIONS] = {0, 1, 1, -1, 0, -1, -1, 1};
constexpr int kRankStep[NUM_DIRECTIONS] = {1, 0, 1, 1, -1, 0, -1, -1};

bool increases(Direction d) noexcept {
  return static_cast<int>(d) < 4;
}

Tables build() noexcept {
  Tables t{};

  for (int d = 0; d < NUM_DIRECTIONS; ++d) {
    for (int s = 0; s < 64; ++s) {
      bb::Bitboard r = 0;
      int f = bb::file_of(static_cast<Square>(s)) + kFileStep[d];
      int rk = bb::rank_of(static_cast<Square>(s)) + kRankStep[d];
      while (f >= 0 && f < 8 && rk >= 0 && rk < 8) {
        r |= bb::sq_bb(bb::make_square(f, rk));
        f += kFileStep[d];
        rk += kRankStep[d];
      }
      t.rays[d][s] = r;
    }
  }

  for (int s = 0; s < 64; ++s) {
    for (int d = 0; d < NUM_DIRECTIONS; ++d) {
      if (is_diagonal(static_cast<Direction>(d)))
        t.bishopReach[s] |= t.rays[d][s];
      else
        t.rookReach[s] |= t.rays[d][s];
    }
  }

  for (int a = 0; a < 64; ++a) {
    for (int d = 0; d < NUM_DIRECTIONS; ++d) {
      const int opposite = (d + 4) % NUM_DIRECTIONS;
      bb::Bitboard r = t.rays[d][a];
      while (r) {
        const Square b = bb::pop_lsb_unchecked(r);
        t.between[a][b] = t.rays[d][a] & t.rays[opposite][b];
        t.line[a][b] = t.rays[d][a] | t.rays[opposite][a] | bb::sq_bb(static_cast<Square>(a));
      }
    }
  }
  return t;
}

}  // namespace

const Tables& tables() noexcept {
  static const Tables instance = build();
  return instance;
}

void init_geometry() noexcept {
  (void)tables();
}

bb::Bitboard ray_attacks(Direction d, Square s, bb::Bitboard occ) noexcept {
  const auto& rays = tables().rays[static_cast<int>(d)];
  const bb::Bitboard r = rays[s];
  const bb::Bitboard blockers = r & occ;
  if (!blockers) return r;
  const Square first = increases(d) ? bb::lsb(blockers) : bb::msb(blockers);
  return r ^ rays[first];
}

bb::Bitboard bishop_attacks(Square s, bb::Bitboard occ) noexcept {
  return ray_attacks(Direction::NorthEast, s, occ) | ray_attacks(Direction::NorthWest, s, occ) |
         ray_attacks(Direction::SouthEast, s, occ) | ray_attacks(Direction::SouthWest, s, occ);
}

bb::Bitboard rook_attacks(Square s, bb::Bitboard occ) noexcept {
  return ray_attacks(Direction::North, s, occ) | ray_attacks(Direction::East, s, occ) |
         ray_attacks(Direction::South, s, occ) | ray_attacks(Direction::West, s, occ);
}

bb::Bitboard piece_attacks(core::PieceType pt, Square s, bb::Bitboard occ) noexcept {
  switch (pt) {
    case core::PieceType::Knight:
      return bb::knight_attacks_from(s);
    case core::PieceType::Bishop:
      return bishop_attacks(s, occ);
    case core::PieceType::Rook:
      return rook_attacks(s, occ);
    case core::PieceType::Queen:
      return queen_attacks(s, occ);
    case core::PieceType::King:
      return bb::king_attacks_from(s);
    default:
      return 0;
  }
}

}  // namespace castellan::model::geometry
