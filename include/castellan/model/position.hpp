#pragma once
#include <cstdint>
#include <optional>

#include "back_rank.hpp"
#include "board.hpp"
#include "castling.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace castellan::model {

/// The part of a position compared for repetition: placement, side to move,
/// castling rights and en passant target. Clocks are excluded.
struct PositionKey {
  Board board;
  core::Color sideToMove = core::Color::White;
  CastlingRights castling;
  core::Square enPassantSquare = core::NO_SQUARE;
  std::uint64_t hash = 0;

  friend bool operator==(const PositionKey& a, const PositionKey& b) noexcept {
    return a.hash == b.hash && a.sideToMove == b.sideToMove &&
           a.enPassantSquare == b.enPassantSquare && a.castling == b.castling &&
           a.board == b.board;
  }
};

/// A complete chess position. Values are never changed after construction;
/// playing a move yields a new Position.
class Position {
 public:
  // Empty board, white to move. Only useful as a placeholder.
  Position() = default;

  [[nodiscard]] static Position start(BackRankId id);
  [[nodiscard]] static Position start(const BackRank& rank);

  // Throws InvalidPositionError if the combination is not a legal chess position.
  [[nodiscard]] static Position fromParts(const Board& board, const GameState& state);

  [[nodiscard]] const Board& getBoard() const noexcept { return m_board; }
  [[nodiscard]] const GameState& getState() const noexcept { return m_state; }

  [[nodiscard]] core::Color sideToMove() const noexcept { return m_state.sideToMove(); }
  [[nodiscard]] MoveId moveId() const noexcept { return m_state.moveId; }
  [[nodiscard]] int halfmoveClock() const noexcept { return m_state.halfmoveClock; }
  [[nodiscard]] std::uint32_t fullmoveNumber() const noexcept {
    return m_state.moveId.fullmoveNumber();
  }
  [[nodiscard]] const CastlingRights& castlingRights() const noexcept { return m_state.castling; }
  [[nodiscard]] core::Square enPassantSquare() const noexcept { return m_state.enPassantSquare; }

  [[nodiscard]] std::optional<bb::Piece> pieceAt(core::Square sq) const noexcept {
    return m_board.getPiece(sq);
  }
  [[nodiscard]] core::Square kingSquare(core::Color c) const noexcept {
    return m_board.kingSquare(c);
  }

  [[nodiscard]] bool inCheck() const noexcept;
  [[nodiscard]] std::uint64_t hash() const noexcept;
  [[nodiscard]] PositionKey key() const noexcept;

  // The caller guarantees the move is legal here (it came from the move generator).
  [[nodiscard]] Position apply(const LegalMove& m) const noexcept;
  // Display-only: moves the pieces of a speculative move without touching turn or clocks.
  [[nodiscard]] Position applyPreMove(const PreMove& m) const noexcept;

  // Throws InvalidPositionError describing the first violated rule.
  void validate() const;

  friend bool operator==(const Position&, const Position&) noexcept = default;

 private:
  Position(const Board& board, const GameState& state) : m_board(board), m_state(state) {}

  template <class Tag>
  void movePieces(const TaggedMove<Tag>& m) noexcept;

  Board m_board;
  GameState m_state;
};

}  // namespace castellan::model
