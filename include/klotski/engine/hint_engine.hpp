#pragma once

#include <atomic>
#include <optional>

#include "../model/move.hpp"
#include "config.hpp"
#include "solver.hpp"

namespace klotski::model {
class KlotskiGame;
}  // namespace klotski::model

namespace klotski::engine {

class HintEngine {
 public:
  explicit HintEngine(const SolverConfig& cfg = {});
  ~HintEngine();

  // Runs the solver under a watchdog that raises the stop flag after `thinkMillis`
  // (<= 0: no limit) or once `externalCancel` is set.
  SolveResult findSolution(const model::KlotskiGame& game, int thinkMillis = DEFAULT_THINK_MS,
                           std::atomic<bool>* externalCancel = nullptr);

  // First move of a shortest solution; nullopt if none or already solved.
  std::optional<model::Move> findHint(const model::KlotskiGame& game,
                                      int thinkMillis = DEFAULT_THINK_MS,
                                      std::atomic<bool>* externalCancel = nullptr);

  const SolveStats& getLastSolveStats() const { return m_last_stats; }
  const SolverConfig& getConfig() const { return m_solver.getConfig(); }
  void setConfig(const SolverConfig& cfg) { m_solver.setConfig(cfg); }

 private:
  Solver m_solver;
  SolveStats m_last_stats;
};

}  // namespace klotski::engine
