#include "castellan/model/move_generator.hpp"

#include "castellan/model/core/geometry.hpp"
#include "castellan/model/move_helper.hpp"

namespace castellan::model {

namespace {

using core::Color;
using core::Square;
using PT = core::PieceType;

constexpr PT kPromoOrder[4] = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

// --------- En passant legality by simulation ---------
// Lifting both pawns off one rank can uncover a slider that ordinary pin logic never
// sees, so the capture is played out on a scratch occupancy and the king re-tested.
bool ep_is_legal(const MoveState& ms, Square from, Square to) noexcept {
  const Board& b = ms.board();
  const Color us = ms.us();
  const Square ksq = ms.kingSquare();
  if (ksq == core::NO_SQUARE) return true;

  const Square capSq = static_cast<Square>(to - bb::forward(us));
  bb::Bitboard occ = b.getAllPieces();
  occ &= ~bb::sq_bb(from);
  occ &= ~bb::sq_bb(capSq);
  occ |= bb::sq_bb(to);

  return (attackersTo(b, ksq, occ) & b.getPieces(~us)) == 0ULL;
}

template <class Emit>
void emit_pawn_move(Square from, Square to, Color us, MoveKind kind, Emit&& emit) {
  if (bb::rank_of(to) == bb::promotion_rank(us)) {
    for (PT p : kPromoOrder) emit(LegalMove{from, to, MoveKind::Normal, p});
  } else {
    emit(LegalMove{from, to, kind});
  }
}

// Calls emit for every legal move of the piece on 'from'.
template <class Emit>
void gen_from(const MoveState& ms, Square from, Emit&& emit) {
  const Board& b = ms.board();
  const auto piece = b.getPiece(from);
  const Color us = ms.us();
  if (!piece || piece->color != us) return;

  const bb::Bitboard ours = b.getPieces(us);
  const bb::Bitboard theirs = b.getPieces(~us);
  const bb::Bitboard occ = b.getAllPieces();

  if (piece->type == PT::King) {
    bb::Bitboard targets = bb::king_attacks_from(from) & ~ours & ~ms.attacked(~us);
    while (targets) emit(LegalMove{from, bb::pop_lsb_unchecked(targets)});

    for (auto side : {CastleSide::KingSide, CastleSide::QueenSide}) {
      if (!ms.canCastle(side)) continue;
      const Square rookSq = ms.position().castlingRights().rookSquare(us, side);
      emit(LegalMove{from, rookSq, MoveKind::Castle, PT::None, side});
    }
    return;
  }

  if (ms.isDoubleCheck()) return;

  bb::Bitboard restrict = ms.checkMask();
  if (const auto ray = ms.pinRay(from)) restrict &= *ray;

  if (piece->type == PT::Pawn) {
    const int fwd = bb::forward(us);
    const Square one = static_cast<Square>(from + fwd);
    if (b.isEmpty(one)) {
      if (restrict & bb::sq_bb(one)) emit_pawn_move(from, one, us, MoveKind::Normal, emit);
      if (bb::rank_of(from) == bb::pawn_rank(us)) {
        const Square two = static_cast<Square>(one + fwd);
        if (b.isEmpty(two) && (restrict & bb::sq_bb(two)))
          emit(LegalMove{from, two, MoveKind::DoublePush});
      }
    }

    const bb::Bitboard attacks = bb::pawn_attacks(us, bb::sq_bb(from));
    for (bb::Bitboard caps = attacks & theirs & restrict; caps;)
      emit_pawn_move(from, bb::pop_lsb_unchecked(caps), us, MoveKind::Normal, emit);

    const Square ep = ms.position().enPassantSquare();
    if (ep != core::NO_SQUARE && (attacks & bb::sq_bb(ep)) && ep_is_legal(ms, from, ep))
      emit(LegalMove{from, ep, MoveKind::EnPassant});
    return;
  }

  bb::Bitboard targets = geometry::piece_attacks(piece->type, from, occ) & ~ours & restrict;
  while (targets) emit(LegalMove{from, bb::pop_lsb_unchecked(targets)});
}

}  // namespace

void MoveGenerator::generateLegalMoves(const MoveState& ms, std::vector<LegalMove>& out) const {
  for (bb::Bitboard pieces = ms.board().getPieces(ms.us()); pieces;)
    generateLegalMovesFrom(ms, bb::pop_lsb_unchecked(pieces), out);
}

std::vector<LegalMove> MoveGenerator::legalMoves(const MoveState& ms) const {
  std::vector<LegalMove> out;
  out.reserve(64);
  generateLegalMoves(ms, out);
  return out;
}

void MoveGenerator::generateLegalMovesFrom(const MoveState& ms, Square from,
                                           std::vector<LegalMove>& out) const {
  gen_from(ms, from, [&](const LegalMove& m) { out.push_back(m); });
}

bb::Bitboard MoveGenerator::legalDestinations(const MoveState& ms, Square from) const {
  bb::Bitboard dest = 0;
  gen_from(ms, from, [&](const LegalMove& m) {
    dest |= bb::sq_bb(m.to());
    if (m.isCastle())
      dest |= bb::sq_bb(castling_path(ms.position().castlingRights(), ms.us(), m.castle()).kingTo);
  });
  return dest;
}

bool MoveGenerator::hasLegalMove(const MoveState& ms) const {
  std::vector<LegalMove> scratch;
  scratch.reserve(32);
  for (bb::Bitboard pieces = ms.board().getPieces(ms.us()); pieces;) {
    generateLegalMovesFrom(ms, bb::pop_lsb_unchecked(pieces), scratch);
    if (!scratch.empty()) return true;
  }
  return false;
}

std::optional<LegalMove> MoveGenerator::validate(const MoveState& ms, const Move& m) const {
  if (!core::validSquare(m.from) || !core::validSquare(m.to)) return std::nullopt;

  std::vector<LegalMove> moves;
  generateLegalMovesFrom(ms, m.from, moves);

  for (const auto& lm : moves)
    if (lm.to() == m.to && lm.promotion() == m.promotion) return lm;

  // King to landing square, unless that is an ordinary king step from here.
  if (m.promotion != PT::None) return std::nullopt;
  for (const auto& lm : moves) {
    if (!lm.isCastle()) continue;
    const CastlingPath p = castling_path(ms.position().castlingRights(), ms.us(), lm.castle());
    if (p.kingTo == m.to && p.kingTo != p.kingFrom &&
        (bb::king_attacks_from(m.from) & bb::sq_bb(m.to)) == 0ULL)
      return lm;
  }
  return std::nullopt;
}

bb::Bitboard MoveGenerator::preMoveDestinations(const Position& pos, Color mover,
                                                Square from) const {
  if (!core::validSquare(from)) return 0;
  const auto piece = pos.pieceAt(from);
  if (!piece || piece->color != mover) return 0;

  const auto& t = geometry::tables();
  switch (piece->type) {
    case PT::Pawn: {
      const bb::Bitboard fromBB = bb::sq_bb(from);
      bb::Bitboard dest = bb::pawn_attacks(mover, fromBB);
      dest |= (mover == Color::White) ? bb::north(fromBB) : bb::south(fromBB);
      if (bb::rank_of(from) == bb::pawn_rank(mover))
        dest |= (mover == Color::White) ? bb::north(bb::north(fromBB))
                                        : bb::south(bb::south(fromBB));
      return dest;
    }
    case PT::Knight:
      return bb::knight_attacks_from(from);
    case PT::Bishop:
      return t.bishopReach[from];
    case PT::Rook:
      return t.rookReach[from];
    case PT::Queen:
      return t.bishopReach[from] | t.rookReach[from];
    case PT::King: {
      bb::Bitboard dest = bb::king_attacks_from(from);
      const CastlingRights& cr = pos.castlingRights();
      if (cr.kingSquare(mover) != from) return dest;
      for (auto side : {CastleSide::KingSide, CastleSide::QueenSide}) {
        if (!cr.has(mover, side)) continue;
        const CastlingPath p = castling_path(cr, mover, side);
        dest |= bb::sq_bb(p.rookFrom) | bb::sq_bb(p.kingTo);
      }
      return dest & ~bb::sq_bb(from);
    }
    default:
      return 0;
  }
}

std::optional<PreMove> MoveGenerator::buildPreMove(const Position& pos, Color mover,
                                                   const Move& m) const {
  const bb::Bitboard dest = preMoveDestinations(pos, mover, m.from);
  if (!core::validSquare(m.to) || (dest & bb::sq_bb(m.to)) == 0ULL) return std::nullopt;

  const PT type = pos.pieceAt(m.from)->type;

  if (type == PT::Pawn) {
    const bool promotes = bb::rank_of(m.to) == bb::promotion_rank(mover);
    const bool validPromo = m.promotion == PT::Queen || m.promotion == PT::Rook ||
                            m.promotion == PT::Bishop || m.promotion == PT::Knight;
    if (promotes ? !validPromo : m.promotion != PT::None) return std::nullopt;
    const bool two = (m.to > m.from ? m.to - m.from : m.from - m.to) == 16;
    return PreMove{m.from, m.to, two ? MoveKind::DoublePush : MoveKind::Normal, m.promotion};
  }

  if (m.promotion != PT::None) return std::nullopt;

  if (type == PT::King) {
    const CastlingRights& cr = pos.castlingRights();
    for (auto side : {CastleSide::KingSide, CastleSide::QueenSide}) {
      if (!cr.has(mover, side) || cr.kingSquare(mover) != m.from) continue;
      const CastlingPath p = castling_path(cr, mover, side);
      const bool kingStep = (bb::king_attacks_from(m.from) & bb::sq_bb(m.to)) != 0ULL;
      if (m.to == p.rookFrom || (m.to == p.kingTo && !kingStep))
        return PreMove{m.from, p.rookFrom, MoveKind::Castle, PT::None, side};
    }
  }
  return PreMove{m.from, m.to};
}

}  // namespace castellan::model
