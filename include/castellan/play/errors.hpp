#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace castellan::play {

enum class PlayError : std::uint8_t {
  IllegalMove,         // not in the legal set (wrong turn, into check, bad castle, ...)
  InvalidPosition,     // malformed starting position
  GameAlreadyTerminal  // a result has already been set
};

[[nodiscard]] const char* to_string(PlayError e) noexcept;

/// Thrown where no result value can be returned (board construction, replay).
class PlayException : public std::runtime_error {
 public:
  PlayException(PlayError error, const std::string& what,
                std::optional<std::size_t> moveIndex = std::nullopt)
      : std::runtime_error(what), m_error(error), m_moveIndex(moveIndex) {}

  [[nodiscard]] PlayError error() const noexcept { return m_error; }
  // Zero-based index of the rejected move in a replayed list.
  [[nodiscard]] std::optional<std::size_t> moveIndex() const noexcept { return m_moveIndex; }

 private:
  PlayError m_error;
  std::optional<std::size_t> m_moveIndex;
};

}  // namespace castellan::play
