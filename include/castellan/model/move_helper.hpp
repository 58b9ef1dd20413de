#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"
#include "core/geometry.hpp"

namespace castellan::model {

// ---------------- Attack queries ----------------

// All pieces of either color attacking sq under occupancy occ.
[[nodiscard]] inline bb::Bitboard attackersTo(const Board& b, core::Square sq,
                                              bb::Bitboard occ) noexcept {
  using PT = core::PieceType;
  const bb::Bitboard target = bb::sq_bb(sq);
  const bb::Bitboard queens = b.getPieces(PT::Queen);

  bb::Bitboard atk = 0;
  atk |= bb::black_pawn_attacks(target) & b.getPieces(core::Color::White, PT::Pawn);
  atk |= bb::white_pawn_attacks(target) & b.getPieces(core::Color::Black, PT::Pawn);
  atk |= bb::knight_attacks_from(sq) & b.getPieces(PT::Knight);
  atk |= bb::king_attacks_from(sq) & b.getPieces(PT::King);
  atk |= geometry::bishop_attacks(sq, occ) & (b.getPieces(PT::Bishop) | queens);
  atk |= geometry::rook_attacks(sq, occ) & (b.getPieces(PT::Rook) | queens);
  return atk & occ;
}

[[nodiscard]] inline bool attackedBy(const Board& b, core::Square sq, core::Color by,
                                     bb::Bitboard occ) noexcept {
  const bb::Bitboard target = bb::sq_bb(sq);
  const bb::Bitboard occ2 = occ & ~target;  // do not let the target piece block rays

  // Pawns: squares from which a pawn of 'by' attacks 'sq'
  const bb::Bitboard pawns = b.getPieces(by, core::PieceType::Pawn);
  const bb::Bitboard pawnFrom = (by == core::Color::White) ? (bb::sw(target) | bb::se(target))
                                                           : (bb::nw(target) | bb::ne(target));
  if (pawnFrom & pawns & occ2) return true;

  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight) & occ2) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King) & occ2) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);

  const bb::Bitboard bq = (b.getPieces(by, core::PieceType::Bishop) | q) & occ2;
  if (bq && (geometry::bishop_attacks(sq, occ2) & bq)) return true;

  const bb::Bitboard rq = (b.getPieces(by, core::PieceType::Rook) | q) & occ2;
  if (rq && (geometry::rook_attacks(sq, occ2) & rq)) return true;

  return false;
}

// Every square attacked by 'by' under occupancy occ.
[[nodiscard]] inline bb::Bitboard attackedSquares(const Board& b, core::Color by,
                                                  bb::Bitboard occ) noexcept {
  using PT = core::PieceType;
  bb::Bitboard atk = bb::pawn_attacks(by, b.getPieces(by, PT::Pawn));
  for (bb::Bitboard s = b.getPieces(by, PT::Knight); s;)
    atk |= bb::knight_attacks_from(bb::pop_lsb_unchecked(s));
  const bb::Bitboard q = b.getPieces(by, PT::Queen);
  for (bb::Bitboard s = b.getPieces(by, PT::Bishop) | q; s;)
    atk |= geometry::bishop_attacks(bb::pop_lsb_unchecked(s), occ);
  for (bb::Bitboard s = b.getPieces(by, PT::Rook) | q; s;)
    atk |= geometry::rook_attacks(bb::pop_lsb_unchecked(s), occ);
  for (bb::Bitboard s = b.getPieces(by, PT::King); s;)
    atk |= bb::king_attacks_from(bb::pop_lsb_unchecked(s));
  return atk;
}

}  // namespace castellan::model
