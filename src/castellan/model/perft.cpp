#include "castellan/model/perft.hpp"

#include "castellan/model/move_generator.hpp"
#include "castellan/model/move_state.hpp"

namespace castellan::model {

namespace {

// One move buffer per ply, indexed by remaining depth.
std::uint64_t perft_rec(const Position& pos, int depth,
                        std::vector<std::vector<LegalMove>>& bufs) {
  std::vector<LegalMove>& moves = bufs[depth];
  moves.clear();
  MoveGenerator{}.generateLegalMoves(MoveState(pos), moves);
  if (depth == 1) return moves.size();

  std::uint64_t nodes = 0;
  for (const LegalMove& m : moves) nodes += perft_rec(pos.apply(m), depth - 1, bufs);
  return nodes;
}

}  // namespace

std::uint64_t perft(const Position& pos, int depth) {
  if (depth <= 0) return 1;
  std::vector<std::vector<LegalMove>> bufs(static_cast<std::size_t>(depth) + 1);
  for (auto& b : bufs) b.reserve(256);
  return perft_rec(pos, depth, bufs);
}

std::vector<std::pair<LegalMove, std::uint64_t>> perftDivide(const Position& pos, int depth) {
  std::vector<std::pair<LegalMove, std::uint64_t>> out;
  if (depth <= 0) return out;

  const MoveState ms(pos);
  const std::vector<LegalMove> moves = MoveGenerator{}.legalMoves(ms);
  out.reserve(moves.size());
  for (const LegalMove& m : moves) out.emplace_back(m, perft(pos.apply(m), depth - 1));
  return out;
}

}  // namespace castellan::model
