#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace castellan::tools::perft {

struct Options {
  std::optional<std::string> fen;
  std::optional<int> backRank;  // Chess960 id, ignored when a FEN is given
  int depth = 4;
  bool divide = false;
  std::optional<std::uint64_t> expect;
  bool verbose = false;
};

Options parse_args(int argc, char** argv);

}  // namespace castellan::tools::perft
