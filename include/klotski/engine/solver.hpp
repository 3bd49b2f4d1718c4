#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <exception>
#include <optional>
#include <vector>

#include "../core/types.hpp"
#include "../model/move.hpp"
#include "config.hpp"

namespace klotski::model {
class KlotskiGame;
}  // namespace klotski::model

namespace klotski::engine {

struct SolveStoppedException : public std::exception {
  const char* what() const noexcept override { return "Solve stopped"; }
};

struct SolveStats {
  std::uint64_t statesExamined = 0;  // dequeued
  std::uint64_t statesVisited = 0;   // distinct board keys seen
  std::uint64_t elapsedMs = 0;
  bool stopped = false;
  bool limitReached = false;
};

struct SolveResult {
  // Shortest sequence of single-cell moves; empty if the board is already solved,
  // nullopt if unsolvable, stopped or over the state limit.
  std::optional<std::vector<model::Move>> path;
  SolveStats stats;
};

// Breadth-first search over board keys. The blocked piece never moves.
class Solver {
 public:
  explicit Solver(const SolverConfig& cfg = {}) : m_cfg(cfg) {}

  SolveResult solve(const model::KlotskiGame& game, std::atomic<bool>* stop = nullptr) const;
  SolveResult solve(const model::KlotskiGame& game, const SolverConfig& cfg,
                    std::atomic<bool>* stop = nullptr) const;

  const SolverConfig& getConfig() const noexcept { return m_cfg; }
  void setConfig(const SolverConfig& cfg) noexcept { m_cfg = cfg; }

 private:
  SolverConfig m_cfg;
};

}  // namespace klotski::engine
