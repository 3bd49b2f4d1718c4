#include "klotski/engine/hint_engine.hpp"

#ifndef KLOTSKI_LOG
#define KLOTSKI_LOG 1
#endif

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "klotski/model/klotski_game.hpp"

namespace klotski::engine {

HintEngine::HintEngine(const SolverConfig& cfg) : m_solver(cfg) {}
HintEngine::~HintEngine() = default;

SolveResult HintEngine::findSolution(const model::KlotskiGame& game, int thinkMillis,
                                     std::atomic<bool>* externalCancel) {
  std::atomic<bool> stopFlag{false};

  std::mutex m;
  std::condition_variable cv;
  bool timerStop = false;

  std::thread timer([&]() {
    auto checkCancel = [&]() {
      if (externalCancel && externalCancel->load()) {
        stopFlag.store(true);
        return true;
      }
      return false;
    };

    const bool timed = thinkMillis > 0;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timed ? thinkMillis : 0);
    while (true) {
      std::unique_lock<std::mutex> lk(m);
      cv.wait_for(lk, std::chrono::milliseconds(20), [&] { return timerStop; });
      if (timerStop) return;
      if (checkCancel()) return;
      if (timed && std::chrono::steady_clock::now() >= deadline) {
        stopFlag.store(true);
        return;
      }
    }
  });

  SolveResult res;
  bool solverThrew = false;
  std::string solverErr;
  try {
    res = m_solver.solve(game, &stopFlag);
  } catch (const std::exception& e) {
    solverThrew = true;
    solverErr = e.what();
    std::cerr << "[HintEngine] solver threw exception: " << e.what() << "\n";
    res = SolveResult{};
  }

  {
    std::lock_guard<std::mutex> lk(m);
    timerStop = true;
  }
  cv.notify_one();
  if (timer.joinable()) timer.join();

  m_last_stats = res.stats;

#if KLOTSKI_LOG
  std::string reason;
  if (externalCancel && externalCancel->load()) {
    reason = "external-cancel";
  } else if (solverThrew) {
    reason = "exception: " + solverErr;
  } else if (res.stats.stopped) {
    reason = "timeout";
  } else if (res.stats.limitReached) {
    reason = "state-limit";
  } else {
    reason = "normal";
  }
  std::cerr << "[HintEngine] Solve finished: reason=" << reason << " time=" << res.stats.elapsedMs
            << "ms maxTime=" << thinkMillis << "ms visited=" << res.stats.statesVisited;
  if (res.path)
    std::cerr << " length=" << res.path->size();
  else
    std::cerr << " length=<none>";
  std::cerr << "\n";
#endif

  return res;
}

std::optional<model::Move> HintEngine::findHint(const model::KlotskiGame& game, int thinkMillis,
                                                std::atomic<bool>* externalCancel) {
  if (game.isTerminal()) return std::nullopt;
  const SolveResult res = findSolution(game, thinkMillis, externalCancel);
  if (!res.path || res.path->empty()) return std::nullopt;
  return res.path->front();
}

}  // namespace klotski::engine
