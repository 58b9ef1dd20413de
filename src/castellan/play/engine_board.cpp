#include "castellan/play/engine_board.hpp"

namespace castellan::play {

Board<EngineMode>::Board(const GameConfig& cfg)
    : m_core(detail::start_position(cfg), cfg.rules) {}

Board<EngineMode>::Board(const model::Position& start, const model::RulesConfig& rules)
    : m_core(start, rules) {}

Board<EngineMode> Board<EngineMode>::replay(const GameConfig& cfg,
                                            const std::vector<model::Move>& moves) {
  Board b(cfg);
  b.m_core.replay(moves);
  return b;
}

Board<EngineMode> Board<EngineMode>::replay(const model::Position& start,
                                            const model::RulesConfig& rules,
                                            const std::vector<model::Move>& moves) {
  Board b(start, rules);
  b.m_core.replay(moves);
  return b;
}

MoveResult Board<EngineMode>::apply(const model::Move& m) {
  return m_core.apply(m);
}

std::optional<PlayError> Board<EngineMode>::resign(core::Color loser) noexcept {
  return m_core.setResult(model::GameResult::win(~loser, model::WinReason::Resigned));
}

std::optional<PlayError> Board<EngineMode>::agreeDraw() noexcept {
  return m_core.setResult(model::GameResult::draw(model::DrawReason::Agreed));
}

std::optional<PlayError> Board<EngineMode>::declareResult(const model::GameResult& r) noexcept {
  return m_core.setResult(r);
}

}  // namespace castellan::play
