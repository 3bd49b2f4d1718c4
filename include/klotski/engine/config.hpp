#pragma once
#include <cstdint>

namespace klotski::engine {
struct SolverConfig {
  std::uint64_t maxStates = 0;  // 0 => unbounded; the full classic graph is ~25k states
  bool verbose = false;         // [Solver] summary per search
};
constexpr int DEFAULT_THINK_MS = 0;  // 0 => hint search runs to completion
}  // namespace klotski::engine
