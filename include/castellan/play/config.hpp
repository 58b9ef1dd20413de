#pragma once

#include "../model/back_rank.hpp"
#include "../model/rules_config.hpp"

namespace castellan::play {

struct GameConfig {
  model::BackRankId backRank = model::BackRankId::standard();
  model::RulesConfig rules{};
};

}  // namespace castellan::play
