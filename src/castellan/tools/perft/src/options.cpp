#include "castellan/tools/perft/options.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace castellan::tools::perft {

[[noreturn]] static void usage_and_exit(int code) {
  std::cerr << "Usage: castellan_perft [options]\n"
               "Options:\n"
               "  --fen <fen>               Start from this position (FEN / X-FEN / Shredder)\n"
               "  --back-rank <0..959>      Chess960 start position (default 518, standard)\n"
               "  --depth <D>               Search depth in plies (default 4)\n"
               "  --divide                  Print the node count below every root move\n"
               "  --expect <N>              Exit with status 2 unless the total equals N\n"
               "  --verbose                 Print timing and the parsed position\n"
               "  --help                    Show this text\n";
  std::exit(code);
}

Options parse_args(int argc, char** argv) {
  Options o;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(1);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--fen") {
      o.fen = require_value(i, "--fen");
    } else if (arg == "--back-rank") {
      o.backRank = std::stoi(require_value(i, "--back-rank"));
    } else if (arg == "--depth") {
      o.depth = std::stoi(require_value(i, "--depth"));
    } else if (arg == "--divide") {
      o.divide = true;
    } else if (arg == "--expect") {
      o.expect = static_cast<std::uint64_t>(std::stoull(require_value(i, "--expect")));
    } else if (arg == "--verbose") {
      o.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(0);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(1);
    }
  }

  if (o.depth < 1) {
    std::cerr << "--depth must be at least 1\n";
    usage_and_exit(1);
  }
  return o;
}

}  // namespace castellan::tools::perft
