#pragma once
#include <array>
#include <cstdint>

#include "back_rank.hpp"
#include "core/model_types.hpp"

namespace castellan::model {

class Board;

enum class CastleSide : std::uint8_t { None = 0, KingSide = 1, QueenSide = 2 };

[[nodiscard]] constexpr int side_index(CastleSide s) noexcept {
  return s == CastleSide::QueenSide ? 1 : 0;
}

inline constexpr std::int8_t NO_FILE = -1;

/// Castling rights of both colors. A right is identified by the original file of
/// the king and of the rook it castles with, so standard and Chess960 back ranks
/// are handled alike. Rights only ever get revoked during a game.
class CastlingRights {
 public:
  CastlingRights() = default;

  // Full rights for both colors as dealt by the back rank.
  [[nodiscard]] static CastlingRights fromBackRank(const BackRank& rank) noexcept;

  [[nodiscard]] bool has(core::Color c, CastleSide s) const noexcept {
    return m_sides[bb::ci(c)].rookFile[side_index(s)] != NO_FILE;
  }
  [[nodiscard]] bool any(core::Color c) const noexcept {
    return has(c, CastleSide::KingSide) || has(c, CastleSide::QueenSide);
  }
  [[nodiscard]] bool any() const noexcept {
    return any(core::Color::White) || any(core::Color::Black);
  }

  [[nodiscard]] int kingFile(core::Color c) const noexcept { return m_sides[bb::ci(c)].kingFile; }
  [[nodiscard]] int rookFile(core::Color c, CastleSide s) const noexcept {
    return m_sides[bb::ci(c)].rookFile[side_index(s)];
  }
  [[nodiscard]] core::Square kingSquare(core::Color c) const noexcept;
  [[nodiscard]] core::Square rookSquare(core::Color c, CastleSide s) const noexcept;

  // Setup only: record a right for a king/rook pair on the back rank.
  void grant(core::Color c, CastleSide s, int kingFile, int rookFile) noexcept;

  void revoke(core::Color c, CastleSide s) noexcept;
  void revokeAll(core::Color c) noexcept;
  // Drops every right whose king or rook originates on sq. Called with the from and
  // to squares of each move, which covers king moves, rook moves and rook captures.
  void revokeForSquare(core::Square sq) noexcept;

  friend bool operator==(const CastlingRights&, const CastlingRights&) noexcept = default;

 private:
  struct Side {
    std::int8_t kingFile = NO_FILE;
    std::array<std::int8_t, 2> rookFile{NO_FILE, NO_FILE};  // [KingSide, QueenSide]
    friend bool operator==(const Side&, const Side&) noexcept = default;
  };
  bb::ByColor<Side> m_sides{};
};

/// Squares involved in one castling move.
struct CastlingPath {
  core::Square kingFrom = core::NO_SQUARE;
  core::Square kingTo = core::NO_SQUARE;
  core::Square rookFrom = core::NO_SQUARE;
  core::Square rookTo = core::NO_SQUARE;
  // Squares that must hold no piece other than the castling king and rook.
  bb::Bitboard mustBeEmpty = 0;
  // King transit, start and destination included. None may be attacked.
  bb::Bitboard kingTransit = 0;
};

// King lands on the g/c file, rook on the f/d file, whatever the starting files.
[[nodiscard]] constexpr int king_castle_file(CastleSide s) noexcept {
  return s == CastleSide::KingSide ? 6 : 2;
}
[[nodiscard]] constexpr int rook_castle_file(CastleSide s) noexcept {
  return s == CastleSide::KingSide ? 5 : 3;
}

// Requires rights.has(c, s).
[[nodiscard]] CastlingPath castling_path(const CastlingRights& rights, core::Color c,
                                         CastleSide s) noexcept;

// Whether castling on side s is currently possible for c: right held, king and rook on
// their squares, king not in check, path free and no transit square attacked.
[[nodiscard]] bool can_castle(const Board& board, const CastlingRights& rights, core::Color c,
                              CastleSide s) noexcept;

}  // namespace castellan::model
