#include "castellan/play/game_id.hpp"

#ifdef CASTELLAN_WITH_RANDOM
#include "castellan/model/core/random.hpp"
#endif

namespace castellan::play {

#ifdef CASTELLAN_WITH_RANDOM
GameId GameId::random() {
  return GameId{model::random::entropy64()};
}
#endif

std::string GameId::toString() const {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string s(16, '0');
  std::uint64_t v = m_value;
  for (int i = 15; i >= 0; --i) {
    s[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return s;
}

}  // namespace castellan::play
