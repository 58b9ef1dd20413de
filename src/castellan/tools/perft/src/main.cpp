#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>

#include "castellan/constants.hpp"
#include "castellan/model/back_rank.hpp"
#include "castellan/model/fen.hpp"
#include "castellan/model/perft.hpp"
#include "castellan/model/position.hpp"
#include "castellan/tools/perft/options.hpp"

int main(int argc, char** argv) {
  using namespace castellan;
  using namespace castellan::tools::perft;

  try {
    const Options opts = parse_args(argc, argv);
    if (opts.verbose) std::cerr << "[perft] " << core::CASTELLAN_VERSION << "\n";

    model::Position pos;
    if (opts.fen) {
      pos = model::fen::parse(*opts.fen);
    } else {
      const model::BackRankId id =
          opts.backRank ? model::BackRankId(*opts.backRank) : model::BackRankId::standard();
      pos = model::Position::start(id);
      if (opts.verbose) std::cerr << "[perft] back rank " << id.value() << "\n";
    }
    if (opts.verbose) std::cerr << "[perft] " << model::fen::write(pos) << "\n";

    const auto t0 = std::chrono::steady_clock::now();
    std::uint64_t total = 0;
    if (opts.divide) {
      for (const auto& [move, nodes] : model::perftDivide(pos, opts.depth)) {
        std::cout << model::to_string(move) << ": " << nodes << "\n";
        total += nodes;
      }
      std::cout << "\n";
    } else {
      total = model::perft(pos, opts.depth);
    }
    const auto t1 = std::chrono::steady_clock::now();

    std::cout << "Nodes searched: " << total << "\n";
    if (opts.verbose) {
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
      std::cerr << "[perft] depth " << opts.depth << " in " << ms << " ms";
      if (ms > 0) std::cerr << " (" << (total * 1000 / static_cast<std::uint64_t>(ms)) << " nps)";
      std::cerr << "\n";
    }

    if (opts.expect && *opts.expect != total) {
      std::cerr << "[perft] mismatch: expected " << *opts.expect << ", got " << total << "\n";
      return 2;
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[perft] error: " << e.what() << "\n";
    return 1;
  }
}
