#pragma once

#include <optional>
#include <vector>

#include "move.hpp"
#include "move_state.hpp"
#include "position.hpp"

namespace castellan::model {

class MoveGenerator {
 public:
  // Every legal move of the side to move. Promotions yield one move per piece kind.
  void generateLegalMoves(const MoveState& ms, std::vector<LegalMove>& out) const;
  [[nodiscard]] std::vector<LegalMove> legalMoves(const MoveState& ms) const;

  // Legal moves of the piece standing on 'from' (none if it is not ours).
  void generateLegalMovesFrom(const MoveState& ms, core::Square from,
                              std::vector<LegalMove>& out) const;
  // Destination squares for highlighting; castling shows both the rook square and
  // the king's landing square.
  [[nodiscard]] bb::Bitboard legalDestinations(const MoveState& ms, core::Square from) const;

  [[nodiscard]] bool hasLegalMove(const MoveState& ms) const;

  // Resolves a submitted move against the legal set. Castling is accepted as king to
  // own rook, or king to its landing square when that is not an ordinary king step.
  [[nodiscard]] std::optional<LegalMove> validate(const MoveState& ms, const Move& m) const;

  // Squares a piece of 'mover' on 'from' could reach on an empty board (plus castling
  // targets while the right is held). Used for speculative moves, so occupancy and
  // check are ignored.
  [[nodiscard]] bb::Bitboard preMoveDestinations(const Position& pos, core::Color mover,
                                                 core::Square from) const;
  [[nodiscard]] std::optional<PreMove> buildPreMove(const Position& pos, core::Color mover,
                                                    const Move& m) const;
};

}  // namespace castellan::model
