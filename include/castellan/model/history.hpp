#pragma once
#include <cstddef>
#include <vector>

#include "move.hpp"
#include "position.hpp"

namespace castellan::model {

/// Positions and moves of a game in order.
/// positionAt(0) is the starting position; positionAt(n) follows the n-th move.
class History {
 public:
  explicit History(const Position& initial);

  void push(const LegalMove& m, const Position& after);
  // Undoes the last push. Never removes the initial position.
  void pop() noexcept;

  [[nodiscard]] std::size_t plyCount() const noexcept { return m_moves.size(); }
  [[nodiscard]] const Position& positionAt(std::size_t ply) const { return m_positions.at(ply); }
  [[nodiscard]] const LegalMove& moveAt(std::size_t ply) const { return m_moves.at(ply); }
  [[nodiscard]] const Position& initial() const noexcept { return m_positions.front(); }
  [[nodiscard]] const Position& current() const noexcept { return m_positions.back(); }
  [[nodiscard]] const std::vector<LegalMove>& moves() const noexcept { return m_moves; }

  // Occurrences of the key since the last pawn move or capture, the current position
  // included. Nothing before such a move can occur again.
  [[nodiscard]] int repetitions(const PositionKey& key) const;
  [[nodiscard]] int currentRepetitions() const { return repetitions(current().key()); }

 private:
  std::vector<Position> m_positions;
  std::vector<LegalMove> m_moves;
};

}  // namespace castellan::model
