#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace castellan::play {

/// Opaque identifier of one game instance.
class GameId {
 public:
  constexpr explicit GameId(std::uint64_t value) noexcept : m_value(value) {}

#ifdef CASTELLAN_WITH_RANDOM
  [[nodiscard]] static GameId random();
#endif

  [[nodiscard]] constexpr std::uint64_t value() const noexcept { return m_value; }
  // 16 lowercase hex digits.
  [[nodiscard]] std::string toString() const;

  friend constexpr bool operator==(const GameId&, const GameId&) noexcept = default;

 private:
  std::uint64_t m_value;
};

}  // namespace castellan::play

template <>
struct std::hash<castellan::play::GameId> {
  std::size_t operator()(const castellan::play::GameId& id) const noexcept {
    return std::hash<std::uint64_t>{}(id.value());
  }
};
