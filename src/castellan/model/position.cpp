#include "castellan/model/position.hpp"

#include <limits>
#include <string>

#include "castellan/model/move_helper.hpp"
#include "castellan/model/position_error.hpp"
#include "castellan/model/zobrist.hpp"

namespace castellan::model {

using core::Color;
using core::PieceType;
using core::Square;

Position Position::start(BackRankId id) {
  return start(BackRank::fromId(id));
}

Position Position::start(const BackRank& rank) {
  Board board;
  for (auto c : {Color::White, Color::Black}) {
    for (int f = 0; f < 8; ++f) {
      board.setPiece(bb::make_square(f, bb::back_rank(c)), bb::Piece{rank.at(f), c});
      board.setPiece(bb::make_square(f, bb::pawn_rank(c)), bb::Piece{PieceType::Pawn, c});
    }
  }
  GameState st;
  st.castling = CastlingRights::fromBackRank(rank);
  return Position(board, st);
}

Position Position::fromParts(const Board& board, const GameState& state) {
  Position pos(board, state);
  pos.validate();
  return pos;
}

bool Position::inCheck() const noexcept {
  const Square ksq = m_board.kingSquare(sideToMove());
  if (ksq == core::NO_SQUARE) return false;
  return attackedBy(m_board, ksq, ~sideToMove(), m_board.getAllPieces());
}

std::uint64_t Position::hash() const noexcept {
  return Zobrist::compute(m_board, m_state);
}

PositionKey Position::key() const noexcept {
  return PositionKey{m_board, sideToMove(), m_state.castling, m_state.enPassantSquare, hash()};
}

template <class Tag>
void Position::movePieces(const TaggedMove<Tag>& m) noexcept {
  const Square from = m.from();
  const Square to = m.to();
  const auto mover = m_board.getPiece(from);
  if (!mover) return;

  switch (m.kind()) {
    case MoveKind::Castle: {
      const CastlingPath p = castling_path(m_state.castling, mover->color, m.castle());
      m_board.removePiece(p.kingFrom);
      m_board.removePiece(p.rookFrom);
      m_board.setPiece(p.kingTo, bb::Piece{PieceType::King, mover->color});
      m_board.setPiece(p.rookTo, bb::Piece{PieceType::Rook, mover->color});
      break;
    }
    case MoveKind::EnPassant:
      m_board.removePiece(static_cast<Square>(to - bb::forward(mover->color)));
      m_board.movePiece(from, to);
      break;
    default:
      m_board.movePiece(from, to);
      if (m.isPromotion()) m_board.setPiece(to, bb::Piece{m.promotion(), mover->color});
      break;
  }
}

Position Position::apply(const LegalMove& m) const noexcept {
  Position next = *this;
  GameState& st = next.m_state;

  const auto mover = m_board.getPiece(m.from());
  const bool isPawn = mover && mover->type == PieceType::Pawn;
  const bool isCapture =
      m.isEnPassant() || (!m.isCastle() && m_board.getPiece(m.to()).has_value());

  next.movePieces(m);

  // Saturates at the field maximum instead of wrapping.
  if (isPawn || isCapture)
    st.halfmoveClock = 0;
  else if (st.halfmoveClock < std::numeric_limits<std::uint16_t>::max())
    ++st.halfmoveClock;
  st.castling.revokeForSquare(m.from());
  st.castling.revokeForSquare(m.to());
  st.enPassantSquare =
      (m.kind() == MoveKind::DoublePush)
          ? static_cast<Square>(m.from() + bb::forward(sideToMove()))
          : core::NO_SQUARE;
  st.moveId = st.moveId.next();
  return next;
}

Position Position::applyPreMove(const PreMove& m) const noexcept {
  Position next = *this;
  next.movePieces(m);
  next.m_state.castling.revokeForSquare(m.from());
  next.m_state.castling.revokeForSquare(m.to());
  return next;
}

void Position::validate() const {
  for (auto c : {Color::White, Color::Black}) {
    const std::string side = core::to_string(c);
    if (bb::popcount(m_board.getPieces(c, PieceType::King)) != 1)
      throw InvalidPositionError(side + " must have exactly one king");
    if (bb::popcount(m_board.getPieces(c, PieceType::Pawn)) > 8)
      throw InvalidPositionError(side + " has more than eight pawns");
    if (bb::popcount(m_board.getPieces(c)) > 16)
      throw InvalidPositionError(side + " has more than sixteen pieces");
  }

  if (m_board.getPieces(PieceType::Pawn) & (bb::RANK_1 | bb::RANK_8))
    throw InvalidPositionError("pawn on the first or last rank");

  const Color us = sideToMove();
  const Square theirKing = m_board.kingSquare(~us);
  if (attackedBy(m_board, theirKing, us, m_board.getAllPieces()))
    throw InvalidPositionError("side not to move is in check");

  const CastlingRights& cr = m_state.castling;
  for (auto c : {Color::White, Color::Black}) {
    for (auto s : {CastleSide::KingSide, CastleSide::QueenSide}) {
      if (!cr.has(c, s)) continue;
      const std::string side = core::to_string(c);
      if (m_board.getPiece(cr.kingSquare(c)) != bb::Piece{PieceType::King, c})
        throw InvalidPositionError(side + " castling right without a king on its square");
      if (m_board.getPiece(cr.rookSquare(c, s)) != bb::Piece{PieceType::Rook, c})
        throw InvalidPositionError(side + " castling right without a rook on its square");
      const bool rookOnSide = (s == CastleSide::KingSide) ? cr.rookFile(c, s) > cr.kingFile(c)
                                                          : cr.rookFile(c, s) < cr.kingFile(c);
      if (!rookOnSide) throw InvalidPositionError(side + " castling rook on the wrong side");
    }
  }

  const Square ep = m_state.enPassantSquare;
  if (ep != core::NO_SQUARE) {
    // The pawn that just advanced two squares belongs to the side not to move.
    const int expectedRank = (us == Color::White) ? 5 : 2;
    const int back = bb::forward(us);
    if (ep >= 64 || bb::rank_of(ep) != expectedRank || !m_board.isEmpty(ep) ||
        !m_board.isEmpty(static_cast<Square>(ep + back)) ||
        m_board.getPiece(static_cast<Square>(ep - back)) != bb::Piece{PieceType::Pawn, ~us})
      throw InvalidPositionError("en passant square does not follow a double pawn push");
  }
}

}  // namespace castellan::model
