#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include "klotski/console/console.hpp"
#include "klotski/constants.hpp"

using namespace klotski;

static bool contains(const std::string& hay, const std::string& needle)
{
  return hay.find(needle) != std::string::npos;
}

static std::string runScript(Console& console, const std::string& script)
{
  std::istringstream in(script);
  std::ostringstream out;
  const int rc = console.run(in, out);
  assert(rc == 0);
  return out.str();
}

int main()
{
  // Board, moves, play, undo
  {
    Console console;
    const std::string out = runScript(console,
                                      "board\n"
                                      "moves\n"
                                      "moves 0 0\n"
                                      "moves 2 1\n"
                                      "moves 1 1\n"
                                      "move 0 0 1 0\n"
                                      "move 3 1 2 1\n"
                                      "undo\n"
                                      "undo\n"
                                      "redo\n"
                                      "bogus\n");
    assert(contains(out, core::CLASSIC_BOARD + "Moves: 0"));
    assert(contains(out, "Move Cao Cao from (0,1) to (1,1)\n"));
    assert(contains(out, "Move Guan Yu from (3,1) to (2,1)\n"));
    assert(contains(out, "2 moves\n"));
    assert(contains(out, "stuck\n"));
    assert(contains(out, "none\n"));
    assert(contains(out, "(2,1)\n"));
    assert(contains(out, "illegal move\n"));
    assert(contains(out, "G C C G \nG C C G \nG Y Y G \nG . . G \nS S S S \nMoves: 1"));
    assert(contains(out, "ok\nnothing to undo\nok\n"));
    assert(contains(out, "unknown command: bogus\n"));
    assert(console.session().historyIndex() == 1);
  }

  // Variants, hints, options and the win announcement
  {
    Console console;
    const std::string out = runScript(console,
                                      "variant enhanced-2\n"
                                      "variant 42\n"
                                      "setoption name Max States value 50000\n"
                                      "setoption name Think Time value abc\n"
                                      "setoption name Verbose value true\n"
                                      "setoption name Colour value red\n"
                                      "hint\n"
                                      "solve\n");
    assert(contains(out, "Variant: enhanced-2  Blocked: General 1"));
    assert(contains(out, "unknown variant\n"));
    assert(contains(out, "invalid value for Think Time\n"));
    assert(contains(out, "unknown option Colour\n"));
    assert(contains(out, "hint Move "));
    assert(contains(out, "solution 30 moves\n"));
    assert(console.options().cfg.maxStates == 50000);
    assert(console.options().cfg.verbose);
    assert(console.session().getSolverConfig().maxStates == 50000);

    std::string script;
    for (int i = 0; i < 30; ++i)
      script += "auto\n";
    script += "auto\n";
    const std::string played = runScript(console, script);
    assert(contains(played, "solved in 30 moves\n"));
    assert(contains(played, "no hint\n"));
    assert(console.session().isSolved());
  }

  // Positions, save/load and quit
  {
    const std::string path =
        (std::filesystem::temp_directory_path() / "klotski_console_test.txt").string();
    Console console;
    const std::string out = runScript(console,
                                      "position C C Y Y C C S S G G G G G G G G S S . .\n"
                                      "save " + path + "\n"
                                      "restart\n"
                                      "load " + path + "\n"
                                      "position G C C G\n"
                                      "load\n"
                                      "quit\n"
                                      "board\n");
    assert(contains(out, "C C Y Y \nC C S S \nG G G G \nG G G G \nS S . . \nMoves: 0"));
    assert(contains(out, "ok\n"));
    assert(contains(out, "error: Invalid board height. Expected 5 rows.\n"));
    assert(contains(out, "usage: load <path>\n"));
    assert(console.session().snapshot() == "C C Y Y \nC C S S \nG G G G \nG G G G \nS S . . \n");
    std::filesystem::remove(path);
  }

  // Shuffle with a seed is reproducible
  {
    Console a;
    Console b;
    const std::string outA = runScript(a, "shuffle 10101\n");
    const std::string outB = runScript(b, "shuffle 10101\nshuffle x\n");
    assert(contains(outA, "G C C G \nG C C G \nG . S G \nG Y Y G \n. S S S \n"));
    assert(contains(outB, "invalid seed\n"));
    assert(a.session().snapshot() == b.session().snapshot());
  }

  std::cout << "console_test passed\n";
  return 0;
}
