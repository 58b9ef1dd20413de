#include "castellan/model/move.hpp"

namespace castellan::model {

std::string square_name(core::Square sq) {
  if (!core::validSquare(sq)) return "-";
  return std::string{static_cast<char>('a' + bb::file_of(sq)),
                     static_cast<char>('1' + bb::rank_of(sq))};
}

std::string to_string(const Move& m) {
  std::string s = square_name(m.from) + square_name(m.to);
  switch (m.promotion) {
    case core::PieceType::Queen:
      s.push_back('q');
      break;
    case core::PieceType::Rook:
      s.push_back('r');
      break;
    case core::PieceType::Bishop:
      s.push_back('b');
      break;
    case core::PieceType::Knight:
      s.push_back('n');
      break;
    default:
      break;
  }
  return s;
}

std::optional<core::Square> parse_square(std::string_view sv) noexcept {
  if (sv.size() != 2) return std::nullopt;
  const int file = sv[0] - 'a';
  const int rank = sv[1] - '1';
  if (static_cast<unsigned>(file) >= 8u || static_cast<unsigned>(rank) >= 8u) return std::nullopt;
  return bb::make_square(file, rank);
}

std::optional<Move> parse_move(std::string_view sv) noexcept {
  if (sv.size() != 4 && sv.size() != 5) return std::nullopt;
  const auto from = parse_square(sv.substr(0, 2));
  const auto to = parse_square(sv.substr(2, 2));
  if (!from || !to) return std::nullopt;

  core::PieceType promo = core::PieceType::None;
  if (sv.size() == 5) {
    switch (sv[4]) {
      case 'q':
        promo = core::PieceType::Queen;
        break;
      case 'r':
        promo = core::PieceType::Rook;
        break;
      case 'b':
        promo = core::PieceType::Bishop;
        break;
      case 'n':
        promo = core::PieceType::Knight;
        break;
      default:
        return std::nullopt;
    }
  }
  return Move{*from, *to, promo};
}

}  // namespace castellan::model
