#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "klotski/console/console.hpp"

namespace klotski::app {

struct RunOptions {
  int variant = 0;
  std::optional<std::int64_t> seed;  // shuffle before play
  std::string levelFile;             // loaded after variant/shuffle
  bool solveOnly = false;            // print a solution and exit
  Console::Options console{};
};

// Exits with a usage message on --help or a malformed command line.
RunOptions parse_args(int argc, char** argv);

}  // namespace klotski::app
