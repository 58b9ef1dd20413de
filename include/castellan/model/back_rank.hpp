#pragma once
#include <array>
#include <cstdint>

#include "../chess_types.hpp"
#include "../constants.hpp"

namespace castellan::model {

/// Index of a Chess960 back rank in Scharnagl numbering (0..959).
class BackRankId {
 public:
  // Throws InvalidPositionError outside 0..959.
  explicit BackRankId(int value);

  [[nodiscard]] static BackRankId standard() noexcept { return BackRankId{}; }
#ifdef CASTELLAN_WITH_RANDOM
  [[nodiscard]] static BackRankId random();
#endif

  [[nodiscard]] int value() const noexcept { return m_value; }
  [[nodiscard]] bool isStandard() const noexcept { return m_value == core::STANDARD_BACK_RANK; }

  friend bool operator==(const BackRankId&, const BackRankId&) noexcept = default;

 private:
  BackRankId() noexcept = default;
  std::uint16_t m_value = core::STANDARD_BACK_RANK;
};

/// A concrete arrangement of the eight back-rank pieces, file a first.
class BackRank {
 public:
  [[nodiscard]] static BackRank fromId(BackRankId id) noexcept;
  [[nodiscard]] static BackRank standard() noexcept { return fromId(BackRankId::standard()); }

  // Throws InvalidPositionError unless the arrangement is a legal Chess960 back rank.
  [[nodiscard]] static BackRank fromPieces(const std::array<core::PieceType, 8>& pieces);

  [[nodiscard]] BackRankId id() const;

  [[nodiscard]] core::PieceType at(int file) const noexcept { return m_pieces[file]; }
  [[nodiscard]] const std::array<core::PieceType, 8>& pieces() const noexcept { return m_pieces; }

  [[nodiscard]] int king() const noexcept { return find(core::PieceType::King)[0]; }
  [[nodiscard]] int queen() const noexcept { return find(core::PieceType::Queen)[0]; }
  // Files in ascending order.
  [[nodiscard]] std::array<int, 2> rooks() const noexcept { return find(core::PieceType::Rook); }
  [[nodiscard]] std::array<int, 2> bishops() const noexcept {
    return find(core::PieceType::Bishop);
  }
  [[nodiscard]] std::array<int, 2> knights() const noexcept {
    return find(core::PieceType::Knight);
  }

  friend bool operator==(const BackRank&, const BackRank&) noexcept = default;

 private:
  BackRank() = default;
  std::array<int, 2> find(core::PieceType pt) const noexcept;

  std::array<core::PieceType, 8> m_pieces{};
};

}  // namespace castellan::model
