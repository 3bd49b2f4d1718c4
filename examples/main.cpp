#include <iostream>
#include <string>

#include "klotski/app/options.hpp"
#include "klotski/console/console.hpp"

int main(int argc, char** argv)
{
  const klotski::app::RunOptions opts = klotski::app::parse_args(argc, argv);

  klotski::Console console(opts.console);
  auto& session = console.session();

  if (!session.start(opts.variant))
    return 1;
  if (opts.seed)
    session.shuffle(*opts.seed);
  if (!opts.levelFile.empty())
  {
    std::string err;
    if (!session.loadLevelFile(opts.levelFile, &err))
    {
      std::cerr << "Could not load level: " << err << "\n";
      return 1;
    }
  }

  if (opts.solveOnly)
  {
    std::cout << session.snapshot();
    const auto res = session.solve();
    if (!res.path)
    {
      std::cout << "no solution\n";
      return 2;
    }
    std::cout << "solution " << res.path->size() << " moves\n";
    klotski::model::KlotskiGame replay = session.game();
    for (const auto& m : *res.path)
    {
      std::cout << replay.describeMove(m) << "\n";
      replay.applyAction(m);
    }
    return 0;
  }

  return console.run(std::cin, std::cout);
}
