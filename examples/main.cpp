#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "castellan/constants.hpp"
#include "castellan/model/back_rank.hpp"
#include "castellan/model/fen.hpp"
#include "castellan/model/game_result.hpp"
#include "castellan/model/move.hpp"
#include "castellan/model/review.hpp"
#include "castellan/play/engine_board.hpp"
#include "castellan/play/errors.hpp"
#include "castellan/play/game_id.hpp"
#include "castellan/play/player_board.hpp"

using namespace castellan;

static std::vector<model::Move> parse_moves(const std::vector<std::string>& text)
{
  std::vector<model::Move> out;
  for (const auto& t : text)
  {
    const auto m = model::parse_move(t);
    if (!m)
      throw std::invalid_argument("bad move text: " + t);
    out.push_back(*m);
  }
  return out;
}

int main()
{
  try
  {
    std::cout << "[demo] " << core::CASTELLAN_VERSION << "\n";

    // Authoritative board: a fool's mate, then the same game rebuilt from its move list.
    play::GameConfig cfg;
#ifdef CASTELLAN_WITH_RANDOM
    const play::GameId id = play::GameId::random();
    std::cout << "[demo] game " << id.toString() << "\n";
#endif
    const auto moves = parse_moves({"f2f3", "e7e5", "g2g4", "d8h4"});
    play::EngineBoard engine(cfg);
    for (const auto& m : moves)
    {
      const play::MoveResult r = engine.apply(m);
      if (!r)
      {
        std::cerr << "[demo] " << model::to_string(m) << " rejected: " << play::to_string(*r.error)
                  << "\n";
        return 1;
      }
      std::cout << "[demo] ply " << r.moveId.value() << ": " << model::to_string(r.move) << "\n";
    }
    if (engine.result())
      std::cout << "[demo] result: " << model::to_string(*engine.result()) << "\n";

    const play::MoveResult late = engine.apply(*model::parse_move("a2a3"));
    std::cout << "[demo] move after mate: " << play::to_string(*late.error) << "\n";

    const play::EngineBoard restored = play::EngineBoard::replay(cfg, moves);
    std::cout << "[demo] replay matches: " << (restored.position() == engine.position() ? "yes" : "no")
              << "\n";

    model::ReviewNavigator review(engine.history());
    review.toStart();
    while (!review.atEnd())
    {
      review.forward();
      std::cout << "[demo] review " << review.ply() << ": " << model::fen::write(review.current())
                << "\n";
    }

    // Client board for black in a Chess960 game, with a pre-move queued during white's turn.
    play::GameConfig c960;
#ifdef CASTELLAN_WITH_RANDOM
    c960.backRank = model::BackRankId::random();
#else
    c960.backRank = model::BackRankId(0);
#endif
    play::PlayerBoard client(core::Color::Black, c960);
    std::cout << "[demo] chess960 #" << c960.backRank.value() << ": "
              << model::fen::write(client.position()) << "\n";

    const play::MoveResult queued = client.submitOurMove(*model::parse_move("e7e5"));
    std::cout << "[demo] pre-move " << play::to_string(queued.preMove) << "\n";
    const play::MoveResult reply = client.submitTheirMove(*model::parse_move("d2d4"));
    std::cout << "[demo] after d2d4 the pre-move was " << play::to_string(reply.preMove) << "\n";
    std::cout << "[demo] " << model::fen::write(client.position()) << "\n";
    return 0;
  }
  catch (const std::exception& e)
  {
    std::cerr << "[demo] error: " << e.what() << "\n";
    return 1;
  }
}
