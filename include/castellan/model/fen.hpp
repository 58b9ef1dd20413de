#pragma once
#include <string>
#include <string_view>

#include "position.hpp"

namespace castellan::model::fen {

// Parses FEN, Shredder-FEN and X-FEN. The castling field accepts KQkq (outermost rook
// on that side), rook file letters (HAha) or a mix. Missing clock fields default to
// "0 1". Throws InvalidPositionError for malformed text or an illegal position.
[[nodiscard]] Position parse(std::string_view fen);

// X-FEN: KQkq where the castling rook is the outermost one, its file letter otherwise.
[[nodiscard]] std::string write(const Position& pos);

}  // namespace castellan::model::fen
