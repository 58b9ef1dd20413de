#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "castling.hpp"
#include "core/model_types.hpp"

namespace castellan::model {

/// A move as submitted by a caller: squares plus optional promotion kind.
/// Castling is given as king -> own rook, or king -> castling destination.
struct Move {
  core::Square from = core::NO_SQUARE;
  core::Square to = core::NO_SQUARE;
  core::PieceType promotion = core::PieceType::None;

  constexpr Move() noexcept = default;
  constexpr Move(core::Square f, core::Square t,
                 core::PieceType promo = core::PieceType::None) noexcept
      : from(f), to(t), promotion(promo) {}

  friend constexpr bool operator==(const Move&, const Move&) noexcept = default;
};

enum class MoveKind : std::uint8_t { Normal = 0, DoublePush, EnPassant, Castle };

namespace detail {
struct LegalTag {};
struct PreTag {};
}  // namespace detail

/// Packed move with its special-move tag. Castling moves store king square -> rook square.
/// Instantiated twice: LegalMove (validated against the current position) and
/// PreMove (structurally built, not yet validated).
template <class Tag>
class TaggedMove {
 public:
  static constexpr std::uint32_t FROM_SHIFT = 0;
  static constexpr std::uint32_t TO_SHIFT = 6;
  static constexpr std::uint32_t PROMO_SHIFT = 12;
  static constexpr std::uint32_t KIND_SHIFT = 16;
  static constexpr std::uint32_t CASTLE_SHIFT = 18;

  constexpr TaggedMove() noexcept = default;
  constexpr TaggedMove(core::Square f, core::Square t, MoveKind kind = MoveKind::Normal,
                       core::PieceType promo = core::PieceType::None,
                       CastleSide cs = CastleSide::None) noexcept
      : m_raw(((static_cast<std::uint32_t>(f) & 0x3Fu) << FROM_SHIFT) |
              ((static_cast<std::uint32_t>(t) & 0x3Fu) << TO_SHIFT) |
              ((static_cast<std::uint32_t>(promo) & 0x0Fu) << PROMO_SHIFT) |
              ((static_cast<std::uint32_t>(kind) & 0x03u) << KIND_SHIFT) |
              ((static_cast<std::uint32_t>(cs) & 0x03u) << CASTLE_SHIFT)) {}

  [[nodiscard]] constexpr core::Square from() const noexcept {
    return static_cast<core::Square>((m_raw >> FROM_SHIFT) & 0x3Fu);
  }
  [[nodiscard]] constexpr core::Square to() const noexcept {
    return static_cast<core::Square>((m_raw >> TO_SHIFT) & 0x3Fu);
  }
  [[nodiscard]] constexpr core::PieceType promotion() const noexcept {
    return static_cast<core::PieceType>((m_raw >> PROMO_SHIFT) & 0x0Fu);
  }
  [[nodiscard]] constexpr MoveKind kind() const noexcept {
    return static_cast<MoveKind>((m_raw >> KIND_SHIFT) & 0x03u);
  }
  [[nodiscard]] constexpr CastleSide castle() const noexcept {
    return static_cast<CastleSide>((m_raw >> CASTLE_SHIFT) & 0x03u);
  }
  [[nodiscard]] constexpr bool isCastle() const noexcept { return kind() == MoveKind::Castle; }
  [[nodiscard]] constexpr bool isEnPassant() const noexcept {
    return kind() == MoveKind::EnPassant;
  }
  [[nodiscard]] constexpr bool isPromotion() const noexcept {
    return promotion() != core::PieceType::None;
  }

  // The plain move value; castling comes out as king -> rook.
  [[nodiscard]] constexpr Move toMove() const noexcept { return Move{from(), to(), promotion()}; }

  friend constexpr bool operator==(const TaggedMove&, const TaggedMove&) noexcept = default;

 private:
  std::uint32_t m_raw = 0;
};

using LegalMove = TaggedMove<detail::LegalTag>;
using PreMove = TaggedMove<detail::PreTag>;

static_assert(std::is_trivially_copyable_v<LegalMove>, "LegalMove must be trivially copyable");
static_assert(sizeof(LegalMove) == 4, "LegalMove should be tightly packed to 4 bytes");

// Coordinate text ("e2e4", "e7e8q") for logs and tools. Not a notation parser.
[[nodiscard]] std::string square_name(core::Square sq);
[[nodiscard]] std::string to_string(const Move& m);
template <class Tag>
[[nodiscard]] std::string to_string(const TaggedMove<Tag>& m) {
  return to_string(m.toMove());
}

// Reverse of the above, nullopt for anything that is not "<sq><sq>[qrbn]".
[[nodiscard]] std::optional<core::Square> parse_square(std::string_view sv) noexcept;
[[nodiscard]] std::optional<Move> parse_move(std::string_view sv) noexcept;

}  // namespace castellan::model
