#include "castellan/play/player_board.hpp"

#include "castellan/model/move_generator.hpp"

namespace castellan::play {

Board<PlayerMode>::Board(core::Color us, const GameConfig& cfg)
    : m_us(us), m_core(detail::start_position(cfg), cfg.rules) {}

Board<PlayerMode>::Board(core::Color us, const model::Position& start,
                         const model::RulesConfig& rules)
    : m_us(us), m_core(start, rules) {}

Board<PlayerMode> Board<PlayerMode>::replay(core::Color us, const GameConfig& cfg,
                                            const std::vector<model::Move>& moves) {
  Board b(us, cfg);
  b.m_core.replay(moves);
  return b;
}

Board<PlayerMode> Board<PlayerMode>::replay(core::Color us, const model::Position& start,
                                            const model::RulesConfig& rules,
                                            const std::vector<model::Move>& moves) {
  Board b(us, start, rules);
  b.m_core.replay(moves);
  return b;
}

MoveResult Board<PlayerMode>::submitOurMove(const model::Move& m) {
  if (isTerminal()) return MoveResult::failure(PlayError::GameAlreadyTerminal);

  if (isOurTurn()) {
    MoveResult r = m_core.apply(m);
    if (r) m_preMove.reset();
    return r;
  }

  const auto pm = model::MoveGenerator{}.buildPreMove(position(), m_us, m);
  if (!pm) return MoveResult::failure(PlayError::IllegalMove);
  m_preMove = *pm;

  MoveResult r;
  r.moveId = position().moveId();
  r.preMove = PreMoveStatus::Queued;
  return r;
}

MoveResult Board<PlayerMode>::submitTheirMove(const model::Move& m) {
  if (isTerminal()) return MoveResult::failure(PlayError::GameAlreadyTerminal);
  if (isOurTurn()) return MoveResult::failure(PlayError::IllegalMove);

  MoveResult r = m_core.apply(m);
  if (!r || !m_preMove) return r;

  const model::PreMove pm = *m_preMove;
  m_preMove.reset();
  r.preMove = PreMoveStatus::Discarded;
  if (isTerminal()) return r;

  const MoveResult mine = m_core.apply(pm.toMove());
  if (mine) {
    r.preMove = PreMoveStatus::Applied;
    r.preMoveApplied = mine.move;
  }
  return r;
}

model::Position Board<PlayerMode>::preview() const noexcept {
  if (!m_preMove) return position();
  return position().applyPreMove(*m_preMove);
}

model::bb::Bitboard Board<PlayerMode>::moveDestinations(core::Square from) const {
  const model::MoveGenerator gen;
  if (isTerminal()) return 0;
  if (isOurTurn()) {
    if (!core::validSquare(from)) return 0;
    return gen.legalDestinations(m_core.moveState(), from);
  }
  return gen.preMoveDestinations(position(), m_us, from);
}

std::optional<PlayError> Board<PlayerMode>::declareResult(const model::GameResult& r) noexcept {
  const auto err = m_core.setResult(r);
  if (!err) m_preMove.reset();
  return err;
}

}  // namespace castellan::play
