#pragma once
#include <stdexcept>
#include <string>

namespace castellan::model {

// Thrown when a position, back rank or setup string violates the rules of chess.
class InvalidPositionError : public std::invalid_argument {
 public:
  explicit InvalidPositionError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace castellan::model
