#include "klotski/app/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "klotski/model/variant.hpp"

namespace klotski::app {

[[noreturn]] static void usage_and_exit(int code) {
  std::cerr << "Usage: klotski [options]\n"
               "Options:\n"
               "  --variant <name|id>   Starting layout (default classic)\n"
               "  --seed <n>            Shuffle the start position with this seed\n"
               "  --level <file>        Load a level/snapshot file\n"
               "  --solve               Print a shortest solution and exit\n"
               "  --max-states <N>      Solver state limit (0 => unbounded)\n"
               "  --think-ms <ms>       Solver time limit (0 => unbounded)\n"
               "  --verbose             Solver statistics on stderr\n"
               "  --help                Show this message\n"
               "Variants:";
  for (const auto& v : model::VARIANTS) std::cerr << ' ' << v.name;
  std::cerr << "\n";
  std::exit(code);
}

RunOptions parse_args(int argc, char** argv) {
  RunOptions o;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(1);
    }
    return argv[++i];
  };

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];

      if (arg == "--variant") {
        const std::string v = require_value(i, "--variant");
        const model::Variant* found = model::findVariant(std::string_view(v));
        if (!found) {
          std::cerr << "Unknown variant: " << v << "\n";
          usage_and_exit(1);
        }
        o.variant = found->id;
      } else if (arg == "--seed") {
        o.seed = static_cast<std::int64_t>(std::stoll(require_value(i, "--seed")));
      } else if (arg == "--level") {
        o.levelFile = require_value(i, "--level");
      } else if (arg == "--solve") {
        o.solveOnly = true;
      } else if (arg == "--max-states") {
        o.console.cfg.maxStates = std::stoull(require_value(i, "--max-states"));
      } else if (arg == "--think-ms") {
        o.console.thinkMillis = std::max(0, std::stoi(require_value(i, "--think-ms")));
      } else if (arg == "--verbose") {
        o.console.cfg.verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        usage_and_exit(0);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        usage_and_exit(1);
      }
    }
  } catch (const std::logic_error& e) {
    std::cerr << "Invalid numeric value (" << e.what() << ")\n";
    usage_and_exit(1);
  }

  return o;
}

}  // namespace klotski::app
