#pragma once
#include <cstddef>

#include "history.hpp"
#include "move.hpp"
#include "position.hpp"

namespace castellan::model {

/// Read-only cursor over a History. The History must outlive the navigator.
/// While the cursor sits on the latest ply it keeps following new moves; once
/// stepped back it stays where it was put.
class ReviewNavigator {
 public:
  explicit ReviewNavigator(const History& history) noexcept : m_history(&history) {}

  const Position& toStart() noexcept;
  const Position& toEnd() noexcept;
  // Both return the position at the (possibly unchanged) cursor.
  const Position& forward() noexcept;
  const Position& back() noexcept;
  // Plies past the end clamp to the last position.
  const Position& jumpTo(std::size_t ply) noexcept;

  [[nodiscard]] const Position& current() const noexcept;
  [[nodiscard]] std::size_t ply() const noexcept;
  [[nodiscard]] std::size_t lastPly() const noexcept { return m_history->plyCount(); }
  [[nodiscard]] bool atStart() const noexcept { return ply() == 0; }
  [[nodiscard]] bool atEnd() const noexcept { return ply() == lastPly(); }

  // Move that led to the current position, none at ply 0.
  [[nodiscard]] const LegalMove* lastMove() const noexcept;

 private:
  const History* m_history;
  std::size_t m_ply = 0;
  bool m_followHead = true;
};

}  // namespace castellan::model
