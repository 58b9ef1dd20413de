#pragma once
#include <cstdint>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"

namespace castellan::model {

namespace detail {

consteval std::uint64_t splitmix64(std::uint64_t& x) {
  std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

consteval std::uint64_t next(std::uint64_t& seed) {
  std::uint64_t v;
  do {
    v = splitmix64(seed);
  } while (v == 0);
  return v;
}

struct ZobristTables {
  std::uint64_t piece[2][6][64];
  std::uint64_t castling[2][2][8];  // [color][side][rook file]
  std::uint64_t epFile[8];
  std::uint64_t side;
};

consteval ZobristTables generate() {
  ZobristTables t{};
  std::uint64_t seed = 0xC0FFEE123456789ULL;

  for (int c = 0; c < 2; ++c)
    for (int p = 0; p < 6; ++p)
      for (int s = 0; s < 64; ++s) t.piece[c][p][s] = next(seed);

  for (int c = 0; c < 2; ++c)
    for (int s = 0; s < 2; ++s)
      for (int f = 0; f < 8; ++f) t.castling[c][s][f] = next(seed);
  for (int f = 0; f < 8; ++f) t.epFile[f] = next(seed);
  t.side = next(seed);

  return t;
}

}  // namespace detail

/// Compile-time keys used to hash repetition keys.
struct Zobrist {
  static inline constexpr detail::ZobristTables tables = detail::generate();

  // Placement, side to move, castling rights and the raw en passant target. No clocks.
  static std::uint64_t compute(const Board& b, const GameState& st) noexcept {
    std::uint64_t h = 0ULL;

    for (int c = 0; c < 2; ++c) {
      const core::Color color = static_cast<core::Color>(c);
      for (int p = 0; p < 6; ++p) {
        bb::Bitboard bbp = b.getPieces(color, static_cast<core::PieceType>(p));
        while (bbp) h ^= tables.piece[c][p][bb::pop_lsb_unchecked(bbp)];
      }
    }

    for (auto color : {core::Color::White, core::Color::Black})
      for (auto s : {CastleSide::KingSide, CastleSide::QueenSide})
        if (st.castling.has(color, s))
          h ^= tables.castling[bb::ci(color)][side_index(s)][st.castling.rookFile(color, s)];

    if (st.enPassantSquare != core::NO_SQUARE) h ^= tables.epFile[bb::file_of(st.enPassantSquare)];
    if (st.sideToMove() == core::Color::Black) h ^= tables.side;
    return h;
  }
};

}  // namespace castellan::model
