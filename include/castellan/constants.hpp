#pragma once

#include <string_view>

namespace castellan::core
{
  inline constexpr std::string_view START_FEN =
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Number of Chess960 back ranks and the id of the classical arrangement.
  inline constexpr int NUM_BACK_RANKS = 960;
  inline constexpr int STANDARD_BACK_RANK = 518;

  // ------------------ Version ------------------
  inline constexpr std::string_view CASTELLAN_VERSION{"castellan 1.0"};
}
