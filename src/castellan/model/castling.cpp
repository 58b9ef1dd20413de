#include "castellan/model/castling.hpp"

#include "castellan/model/board.hpp"
#include "castellan/model/core/geometry.hpp"
#include "castellan/model/move_helper.hpp"

namespace castellan::model {

CastlingRights CastlingRights::fromBackRank(const BackRank& rank) noexcept {
  CastlingRights r;
  const auto rooks = rank.rooks();
  for (auto c : {core::Color::White, core::Color::Black}) {
    r.grant(c, CastleSide::QueenSide, rank.king(), rooks[0]);
    r.grant(c, CastleSide::KingSide, rank.king(), rooks[1]);
  }
  return r;
}

core::Square CastlingRights::kingSquare(core::Color c) const noexcept {
  const int f = kingFile(c);
  return f == NO_FILE ? core::NO_SQUARE : bb::make_square(f, bb::back_rank(c));
}

core::Square CastlingRights::rookSquare(core::Color c, CastleSide s) const noexcept {
  const int f = rookFile(c, s);
  return f == NO_FILE ? core::NO_SQUARE : bb::make_square(f, bb::back_rank(c));
}

void CastlingRights::grant(core::Color c, CastleSide s, int kingFile, int rookFile) noexcept {
  Side& side = m_sides[bb::ci(c)];
  side.kingFile = static_cast<std::int8_t>(kingFile);
  side.rookFile[side_index(s)] = static_cast<std::int8_t>(rookFile);
}

void CastlingRights::revoke(core::Color c, CastleSide s) noexcept {
  Side& side = m_sides[bb::ci(c)];
  side.rookFile[side_index(s)] = NO_FILE;
  if (side.rookFile[0] == NO_FILE && side.rookFile[1] == NO_FILE) side.kingFile = NO_FILE;
}

void CastlingRights::revokeAll(core::Color c) noexcept {
  m_sides[bb::ci(c)] = Side{};
}

void CastlingRights::revokeForSquare(core::Square sq) noexcept {
  for (auto c : {core::Color::White, core::Color::Black}) {
    if (!any(c) || bb::rank_of(sq) != bb::back_rank(c)) continue;
    const int file = bb::file_of(sq);
    if (file == kingFile(c)) {
      revokeAll(c);
      continue;
    }
    for (auto s : {CastleSide::KingSide, CastleSide::QueenSide})
      if (rookFile(c, s) == file) revoke(c, s);
  }
}

CastlingPath castling_path(const CastlingRights& rights, core::Color c, CastleSide s) noexcept {
  CastlingPath p;
  const int rank = bb::back_rank(c);
  p.kingFrom = rights.kingSquare(c);
  p.rookFrom = rights.rookSquare(c, s);
  p.kingTo = bb::make_square(king_castle_file(s), rank);
  p.rookTo = bb::make_square(rook_castle_file(s), rank);

  p.kingTransit = geometry::between(p.kingFrom, p.kingTo) | bb::sq_bb(p.kingFrom) |
                  bb::sq_bb(p.kingTo);
  const bb::Bitboard rookTransit =
      geometry::between(p.rookFrom, p.rookTo) | bb::sq_bb(p.rookFrom) | bb::sq_bb(p.rookTo);
  p.mustBeEmpty = (p.kingTransit | rookTransit) & ~(bb::sq_bb(p.kingFrom) | bb::sq_bb(p.rookFrom));
  return p;
}

bool can_castle(const Board& board, const CastlingRights& rights, core::Color c,
                CastleSide s) noexcept {
  if (!rights.has(c, s)) return false;
  const CastlingPath p = castling_path(rights, c, s);

  const bb::Piece king{core::PieceType::King, c};
  const bb::Piece rook{core::PieceType::Rook, c};
  if (board.getPiece(p.kingFrom) != king || board.getPiece(p.rookFrom) != rook) return false;

  const bb::Bitboard occ = board.getAllPieces();
  if (occ & p.mustBeEmpty) return false;

  // The castling rook is lifted so a slider behind it on the back rank is seen.
  const bb::Bitboard occNoRook = occ & ~bb::sq_bb(p.rookFrom);
  for (bb::Bitboard t = p.kingTransit; t;) {
    if (attackedBy(board, bb::pop_lsb_unchecked(t), ~c, occNoRook)) return false;
  }
  return true;
}

}  // namespace castellan::model
