#pragma once

namespace castellan::model {

// Automatic draw rules. Checkmate and stalemate are always detected.
struct RulesConfig {
  bool threefoldRepetition = true;
  bool fiftyMoveRule = true;
  bool insufficientMaterial = true;

  int repetitionLimit = 3;
  int fiftyMovePlies = 100;
};

}  // namespace castellan::model
