#include "castellan/play/play_core.hpp"

#include <string>

#include "castellan/model/move_generator.hpp"
#include "castellan/model/position_error.hpp"

namespace castellan::play::detail {

namespace {

model::Position validated(const model::Position& p) {
  try {
    p.validate();
  } catch (const model::InvalidPositionError& e) {
    throw PlayException(PlayError::InvalidPosition, e.what());
  }
  return p;
}

}  // namespace

model::Position start_position(const GameConfig& cfg) {
  return model::Position::start(cfg.backRank);
}

PlayCore::PlayCore(const model::Position& start, const model::RulesConfig& rules)
    : m_rules(rules), m_history(validated(start)), m_state(start) {
  m_result = model::detect_result(m_state, m_history, m_rules);
}

std::vector<model::LegalMove> PlayCore::legalMoves() const {
  if (isTerminal()) return {};
  return model::MoveGenerator{}.legalMoves(m_state);
}

std::optional<model::LegalMove> PlayCore::resolve(const model::Move& m) const {
  return model::MoveGenerator{}.validate(m_state, m);
}

MoveResult PlayCore::apply(const model::Move& m) {
  if (isTerminal()) return MoveResult::failure(PlayError::GameAlreadyTerminal);
  const auto lm = resolve(m);
  if (!lm) return MoveResult::failure(PlayError::IllegalMove);

  const model::Position next = position().apply(*lm);
  model::MoveState nextState(next);

  m_history.push(*lm, next);
  std::optional<model::GameResult> nextResult;
  try {
    nextResult = model::detect_result(nextState, m_history, m_rules);
  } catch (...) {
    m_history.pop();
    throw;
  }

  m_state = nextState;
  m_result = nextResult;
  return MoveResult::success(*lm, next.moveId());
}

std::optional<PlayError> PlayCore::setResult(const model::GameResult& r) noexcept {
  if (isTerminal()) return PlayError::GameAlreadyTerminal;
  m_result = r;
  return std::nullopt;
}

void PlayCore::replay(const std::vector<model::Move>& moves) {
  for (std::size_t i = 0; i < moves.size(); ++i) {
    const MoveResult r = apply(moves[i]);
    if (!r)
      throw PlayException(*r.error,
                          "replay rejected move " + std::to_string(i) + " (" +
                              model::to_string(moves[i]) + "): " + to_string(*r.error),
                          i);
  }
}

}  // namespace castellan::play::detail
