#include "castellan/model/back_rank.hpp"

#include <string>

#include "castellan/model/position_error.hpp"

#ifdef CASTELLAN_WITH_RANDOM
#include "castellan/model/core/random.hpp"
#endif

namespace castellan::model {

namespace {

using core::PieceType;

// Knight placements over the five squares left after bishops and queen.
constexpr int kKnightTable[10][2] = {{0, 1}, {0, 2}, {0, 3}, {0, 4}, {1, 2},
                                     {1, 3}, {1, 4}, {2, 3}, {2, 4}, {3, 4}};

// File of the n-th empty square, counting from file a.
int nth_empty(const std::array<PieceType, 8>& rank, int n) noexcept {
  for (int f = 0; f < 8; ++f) {
    if (rank[f] != PieceType::None) continue;
    if (n-- == 0) return f;
  }
  return -1;
}

// Index of 'file' among the empty squares (file itself counts as empty).
int empty_index(const std::array<PieceType, 8>& rank, int file) noexcept {
  int n = 0;
  for (int f = 0; f < file; ++f)
    if (rank[f] == PieceType::None) ++n;
  return n;
}

}  // namespace

BackRankId::BackRankId(int value) {
  if (value < 0 || value >= core::NUM_BACK_RANKS)
    throw InvalidPositionError("back rank id out of range: " + std::to_string(value));
  m_value = static_cast<std::uint16_t>(value);
}

#ifdef CASTELLAN_WITH_RANDOM
BackRankId BackRankId::random() {
  random::SplitMix64 rng(random::entropy64());
  return BackRankId(static_cast<int>(rng.below(core::NUM_BACK_RANKS)));
}
#endif

BackRank BackRank::fromId(BackRankId id) noexcept {
  BackRank br;
  auto& r = br.m_pieces;
  r.fill(PieceType::None);

  int n = id.value();
  r[(n % 4) * 2 + 1] = PieceType::Bishop;  // light square bishop: b, d, f, h
  n /= 4;
  r[(n % 4) * 2] = PieceType::Bishop;  // dark square bishop: a, c, e, g
  n /= 4;
  r[nth_empty(r, n % 6)] = PieceType::Queen;
  n /= 6;

  // Both knight squares are resolved before either is placed.
  const int k1 = nth_empty(r, kKnightTable[n][0]);
  const int k2 = nth_empty(r, kKnightTable[n][1]);
  r[k1] = PieceType::Knight;
  r[k2] = PieceType::Knight;

  r[nth_empty(r, 0)] = PieceType::Rook;
  r[nth_empty(r, 0)] = PieceType::King;
  r[nth_empty(r, 0)] = PieceType::Rook;
  return br;
}

BackRank BackRank::fromPieces(const std::array<PieceType, 8>& pieces) {
  int counts[core::NUM_PIECE_TYPES + 1] = {};
  for (PieceType p : pieces) ++counts[core::idx(p)];
  if (counts[core::idx(PieceType::King)] != 1 || counts[core::idx(PieceType::Queen)] != 1 ||
      counts[core::idx(PieceType::Rook)] != 2 || counts[core::idx(PieceType::Bishop)] != 2 ||
      counts[core::idx(PieceType::Knight)] != 2)
    throw InvalidPositionError("back rank must hold K, Q, 2 R, 2 B and 2 N");

  BackRank br;
  br.m_pieces = pieces;

  const auto b = br.bishops();
  if (((b[0] ^ b[1]) & 1) == 0)
    throw InvalidPositionError("back rank bishops must stand on opposite colors");

  const auto rk = br.rooks();
  const int k = br.king();
  if (!(rk[0] < k && k < rk[1]))
    throw InvalidPositionError("back rank king must stand between the rooks");
  return br;
}

BackRankId BackRank::id() const {
  const auto b = bishops();
  const int light = (b[0] & 1) ? b[0] : b[1];
  const int dark = (b[0] & 1) ? b[1] : b[0];

  std::array<PieceType, 8> r{};
  r.fill(PieceType::None);
  r[light] = PieceType::Bishop;
  r[dark] = PieceType::Bishop;
  const int q = empty_index(r, queen());
  r[queen()] = PieceType::Queen;

  const auto n = knights();
  const int n1 = empty_index(r, n[0]);
  const int n2 = empty_index(r, n[1]);
  int pattern = 0;
  for (int i = 0; i < 10; ++i) {
    if (kKnightTable[i][0] == n1 && kKnightTable[i][1] == n2) {
      pattern = i;
      break;
    }
  }

  const int value = ((pattern * 6 + q) * 4 + dark / 2) * 4 + (light - 1) / 2;
  return BackRankId(value);
}

std::array<int, 2> BackRank::find(PieceType pt) const noexcept {
  std::array<int, 2> out{-1, -1};
  int n = 0;
  for (int f = 0; f < 8 && n < 2; ++f)
    if (m_pieces[f] == pt) out[n++] = f;
  return out;
}

}  // namespace castellan::model
