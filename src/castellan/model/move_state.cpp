#include "castellan/model/move_state.hpp"

#include "castellan/model/core/geometry.hpp"
#include "castellan/model/move_helper.hpp"

namespace castellan::model {

using core::Color;
using core::Square;
using PT = core::PieceType;

MoveState::MoveState(const Position& pos) : m_pos(pos) {
  const Board& b = m_pos.getBoard();
  const Color side = us();
  const bb::Bitboard occ = b.getAllPieces();

  m_king = b.kingSquare(side);

  // The opponent's map first, with our king lifted so it can not hide behind itself.
  const bb::Bitboard kingBB = (m_king == core::NO_SQUARE) ? 0ULL : bb::sq_bb(m_king);
  m_attacked[bb::ci(~side)] = attackedSquares(b, ~side, occ & ~kingBB);
  m_attacked[bb::ci(side)] = attackedSquares(b, side, occ);

  if (m_king == core::NO_SQUARE) return;

  m_checkers = attackersTo(b, m_king, occ) & b.getPieces(~side);
  if (!m_checkers) {
    m_checkMask = ~0ULL;
  } else if (bb::more_than_one(m_checkers)) {
    m_checkMask = 0ULL;
  } else {
    const Square checker = bb::lsb(m_checkers);
    m_checkMask = geometry::between(m_king, checker) | m_checkers;
  }

  computePins();
}

// Exactly-one-blocker rule along every line from the king to an enemy slider of the
// matching orientation.
void MoveState::computePins() noexcept {
  const Board& b = m_pos.getBoard();
  const Color side = us();
  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard ours = b.getPieces(side);
  const auto& t = geometry::tables();

  const bb::Bitboard theirQ = b.getPieces(~side, PT::Queen);
  const bb::Bitboard diag = (b.getPieces(~side, PT::Bishop) | theirQ) & t.bishopReach[m_king];
  const bb::Bitboard ortho = (b.getPieces(~side, PT::Rook) | theirQ) & t.rookReach[m_king];

  for (bb::Bitboard s = diag | ortho; s;) {
    const Square pinner = bb::pop_lsb_unchecked(s);
    const bb::Bitboard between = geometry::between(m_king, pinner);
    const bb::Bitboard blockers = between & occ;
    if (!blockers || bb::more_than_one(blockers)) continue;
    if ((blockers & ours) == 0ULL) continue;
    m_pins.add(bb::lsb(blockers), between | bb::sq_bb(pinner));
  }
}

bool MoveState::canCastle(CastleSide s) const noexcept {
  if (isCheck()) return false;
  return can_castle(m_pos.getBoard(), m_pos.castlingRights(), us(), s);
}

}  // namespace castellan::model
