#include "castellan/model/review.hpp"

#include <algorithm>

namespace castellan::model {

std::size_t ReviewNavigator::ply() const noexcept {
  return m_followHead ? lastPly() : std::min(m_ply, lastPly());
}

const Position& ReviewNavigator::current() const noexcept {
  return m_history->positionAt(ply());
}

const LegalMove* ReviewNavigator::lastMove() const noexcept {
  const std::size_t p = ply();
  if (p == 0) return nullptr;
  return &m_history->moveAt(p - 1);
}

const Position& ReviewNavigator::toStart() noexcept {
  return jumpTo(0);
}

const Position& ReviewNavigator::toEnd() noexcept {
  return jumpTo(lastPly());
}

const Position& ReviewNavigator::forward() noexcept {
  if (!atEnd()) return jumpTo(ply() + 1);
  return current();
}

const Position& ReviewNavigator::back() noexcept {
  if (!atStart()) return jumpTo(ply() - 1);
  return current();
}

const Position& ReviewNavigator::jumpTo(std::size_t target) noexcept {
  m_ply = std::min(target, lastPly());
  m_followHead = (m_ply == lastPly());
  return current();
}

}  // namespace castellan::model
