#include "klotski/engine/solver.hpp"

#ifndef KLOTSKI_LOG
#define KLOTSKI_LOG 1
#endif

#include <chrono>
#include <cstddef>
#include <deque>
#include <iostream>
#include <string>
#include <unordered_set>

#include "klotski/model/board.hpp"
#include "klotski/model/board_key.hpp"
#include "klotski/model/klotski_game.hpp"
#include "klotski/model/move_generator.hpp"

namespace klotski::engine {

namespace {

using Layout = std::array<core::Coord, core::PIECE_COUNT>;

struct Node {
  Layout layout;
  std::int32_t parent;  // -1 at the root
  model::Move move;     // move that led here from `parent`
};

inline void check_stop(std::atomic<bool>* stop) {
  if (stop && stop->load(std::memory_order_relaxed)) throw SolveStoppedException();
}

inline Layout captureLayout(const model::Board& b) {
  Layout l{};
  for (std::size_t i = 0; i < b.pieceCount() && i < l.size(); ++i) l[i] = b.piece(i).position();
  return l;
}

inline void restoreLayout(model::Board& b, const Layout& l) {
  for (std::size_t i = 0; i < b.pieceCount() && i < l.size(); ++i) b.piece(i).setPosition(l[i]);
}

inline bool isSolved(const model::Board& b) {
  const model::Piece* p = b.getPieceAtPrecise(core::WIN_CELL);
  return p && p->id() == core::PRIMARY_PIECE;
}

std::vector<model::Move> tracePath(const std::vector<Node>& nodes, std::int32_t idx) {
  std::vector<model::Move> path;
  for (const Node* n = &nodes[static_cast<std::size_t>(idx)]; n->parent >= 0;
       n = &nodes[static_cast<std::size_t>(n->parent)]) {
    path.push_back(n->move);
  }
  return {path.rbegin(), path.rend()};
}

}  // namespace

SolveResult Solver::solve(const model::KlotskiGame& game, std::atomic<bool>* stop) const {
  return solve(game, m_cfg, stop);
}

SolveResult Solver::solve(const model::KlotskiGame& game, const SolverConfig& cfg,
                          std::atomic<bool>* stop) const {
  using steady_clock = std::chrono::steady_clock;
  const auto t0 = steady_clock::now();

  SolveResult res;
  model::Board scratch = game.getBoard();
  const core::PieceId blocked = game.getBlockedId();
  const model::MoveGenerator gen;

  std::vector<Node> nodes;
  std::deque<std::int32_t> frontier;
  std::unordered_set<model::BoardKey> visited;
  std::vector<model::Move> moves;
  moves.reserve(4 * core::PIECE_COUNT);

  nodes.push_back(Node{captureLayout(scratch), -1, model::Move{}});
  visited.insert(model::computeKey(scratch));
  frontier.push_back(0);

  try {
    while (!frontier.empty()) {
      const std::int32_t idx = frontier.front();
      frontier.pop_front();
      ++res.stats.statesExamined;
      if ((res.stats.statesExamined & 63) == 0) check_stop(stop);

      const Layout layout = nodes[static_cast<std::size_t>(idx)].layout;
      restoreLayout(scratch, layout);
      if (isSolved(scratch)) {
        res.path = tracePath(nodes, idx);
        break;
      }

      moves.clear();
      gen.generateAllExcept(scratch, blocked, moves);
      for (const auto& m : moves) {
        model::Piece* piece = scratch.getPieceAt(m.from);
        const core::Coord before = piece->position();
        piece->setPosition(core::offset(before, m.delta()));
        const model::BoardKey key = model::computeKey(scratch);
        const bool fresh = visited.insert(key).second;
        if (fresh) {
          nodes.push_back(Node{captureLayout(scratch), idx, m});
          frontier.push_back(static_cast<std::int32_t>(nodes.size() - 1));
        }
        piece->setPosition(before);

        if (fresh && cfg.maxStates > 0 && visited.size() > cfg.maxStates) {
          res.stats.limitReached = true;
          break;
        }
      }
      if (res.stats.limitReached) break;
    }
  } catch (const SolveStoppedException&) {
    res.stats.stopped = true;
    res.path.reset();
  }

  res.stats.statesVisited = visited.size();
  res.stats.elapsedMs = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - t0).count());

#if KLOTSKI_LOG
  if (cfg.verbose) {
    std::string reason;
    if (res.stats.stopped)
      reason = "stopped";
    else if (res.stats.limitReached)
      reason = "state-limit";
    else if (res.path)
      reason = "solved";
    else
      reason = "exhausted";
    std::cerr << "[Solver] Search finished: reason=" << reason << "\n";
    std::cerr << "[Solver] examined=" << res.stats.statesExamined
              << " visited=" << res.stats.statesVisited << " time=" << res.stats.elapsedMs
              << "ms";
    if (res.path) std::cerr << " length=" << res.path->size();
    std::cerr << "\n";
  }
#endif

  return res;
}

}  // namespace klotski::engine
