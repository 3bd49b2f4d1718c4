#pragma once
#include <iosfwd>
#include <string>

#include "klotski/app/game_session.hpp"
#include "klotski/engine/config.hpp"

namespace klotski {

// Line-based front end: one command per line, replies on `out`.
class Console {
 public:
  struct Options {
    engine::SolverConfig cfg{};
    int thinkMillis = engine::DEFAULT_THINK_MS;
  };

  Console() = default;
  explicit Console(const Options& opts);

  // Returns 0 on quit/exit or end of input.
  int run(std::istream& in, std::ostream& out);

  app::GameSession& session() noexcept { return m_session; }
  const Options& options() const noexcept { return m_options; }

 private:
  void showHelp(std::ostream& out) const;
  void showOptions(std::ostream& out) const;
  void setOption(const std::string& line, std::ostream& out);
  void printBoard(std::ostream& out) const;
  void announceIfSolved(std::ostream& out) const;

  Options m_options;
  app::GameSession m_session;
};

}  // namespace klotski
