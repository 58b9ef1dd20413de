#include "castellan/model/history.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace castellan::model {

namespace {

template <class T>
void reserve_one_more(std::vector<T>& v) {
  if (v.size() == v.capacity()) v.reserve(v.capacity() * 2 + 1);
}

}  // namespace

History::History(const Position& initial) {
  m_positions.reserve(128);
  m_moves.reserve(128);
  m_positions.push_back(initial);
}

// Everything that can throw happens before the first visible change.
void History::push(const LegalMove& m, const Position& after) {
  reserve_one_more(m_positions);
  reserve_one_more(m_moves);
  m_positions.push_back(after);
  m_moves.push_back(m);
}

void History::pop() noexcept {
  if (m_moves.empty()) return;
  m_positions.pop_back();
  m_moves.pop_back();
}

// Walks back over the reversible plies only. A saturated clock no longer tells how far
// that is, so the whole game is searched then.
int History::repetitions(const PositionKey& key) const {
  const std::size_t last = m_positions.size() - 1;
  const int clock = current().halfmoveClock();
  const std::size_t window = clock == std::numeric_limits<std::uint16_t>::max()
                                 ? last
                                 : std::min<std::size_t>(static_cast<std::size_t>(clock), last);

  int count = 0;
  for (std::size_t i = last - window; i <= last; ++i) {
    const Position& p = m_positions[i];
    if (p.hash() == key.hash && p.key() == key) ++count;
  }
  return count;
}

}  // namespace castellan::model
