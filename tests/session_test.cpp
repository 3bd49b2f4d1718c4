#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "klotski/app/game_session.hpp"
#include "klotski/constants.hpp"
#include "klotski/model/variant.hpp"

#ifndef KLOTSKI_LEVELS_DIR
#define KLOTSKI_LEVELS_DIR "levels"
#endif

using namespace klotski;

static std::string tempPath(const std::string& name)
{
  return (std::filesystem::temp_directory_path() / name).string();
}

int main()
{
  // Undo / redo cursor
  {
    app::GameSession s;
    assert(s.start(0));
    assert(!s.undo());
    assert(!s.redo());

    assert(s.play({3, 1}, {2, 1}));
    assert(s.play({4, 1}, {3, 1}));
    assert(!s.play({0, 0}, {1, 0}));
    assert(s.historyIndex() == 2);
    assert(s.history().size() == 2);

    assert(s.undo());
    assert(s.historyIndex() == 1);
    assert(s.snapshot() == "G C C G \nG C C G \nG Y Y G \nG . . G \nS S S S \n");
    assert(s.undo());
    assert(s.snapshot() == core::CLASSIC_BOARD);
    assert(!s.undo());
    assert(s.canRedo());

    assert(s.redo());
    assert(s.redo());
    assert(!s.redo());
    assert(s.historyIndex() == 2);
    // The engine counter only grows.
    assert(s.game().getMoveCount() == 6);

    // A new move after undo drops the redo tail.
    assert(s.undo());
    assert(s.play({4, 0}, {3, 1}) == false);
    assert(s.play({0, 1}, {1, 1}) == false);
    assert(s.play({4, 2}, {3, 2}));
    assert(s.historyIndex() == 2);
    assert(s.history().size() == 2);
    assert(!s.redo());
  }

  // Blocked piece is locked for the player
  {
    app::GameSession s;
    assert(s.start(1));
    assert(s.game().isLegalMove({4, 3}, {3, 3}));
    assert(!s.play({4, 3}, {3, 3}));
    assert(s.historyIndex() == 0);
    assert(!s.start(99));
    assert(s.game().getVariantId() == 1);
  }

  // Restart and shuffle clear the history
  {
    app::GameSession s;
    assert(s.start(2));
    s.shuffle(10101);
    assert(s.historyIndex() == 0);
    const model::Move first = s.game().getPlayableMoves().front();
    assert(s.play(first));
    assert(s.historyIndex() == 1);
    s.restart();
    assert(s.historyIndex() == 0);
    assert(s.snapshot() == "G C C G \nG C C G \nG . . . \nG Y Y . \nS S S S \n");
    assert(s.game().getBlockedId() == 2);
  }

  // Hints play out a shortest solution
  {
    app::GameSession s;
    assert(s.start(0));
    const auto h = s.hint();
    assert(h && *h == (model::Move{{3, 1}, {2, 1}}));

    assert(s.start(2));
    int steps = 0;
    while (!s.isSolved() && steps < 100)
    {
      assert(s.autoStep());
      ++steps;
    }
    assert(s.isSolved());
    assert(steps == 30);
    assert(s.historyIndex() == 30);
    assert(!s.hint());
    assert(!s.autoStep());
  }

  // Save / load
  {
    const std::string path = tempPath("klotski_session_test.txt");

    app::GameSession a;
    assert(a.start(0));
    assert(a.play({3, 1}, {2, 1}));
    std::string err;
    assert(a.saveToFile(path, &err));

    std::ifstream in(path);
    std::string first;
    std::getline(in, first);
    assert(first == "G C C G ");

    app::GameSession b;
    assert(b.start(0));
    assert(b.play({0, 1}, {1, 1}));
    assert(b.loadFromFile(path, &err));
    assert(b.snapshot() == a.snapshot());
    assert(b.historyIndex() == 0);
    assert(!b.undo());

    std::filesystem::remove(path);
    assert(!b.loadFromFile(path, &err));
    assert(err.find("Could not open") != std::string::npos);
    assert(b.snapshot() == a.snapshot());

    {
      std::ofstream bad(path);
      bad << "G C C G \nG C C G \n";
    }
    assert(!b.loadFromFile(path, &err));
    assert(err.find("Invalid board height. Expected 5 rows.") != std::string::npos);
    assert(b.snapshot() == a.snapshot());
    std::filesystem::remove(path);

    assert(!a.saveToFile(tempPath("no_such_dir_klotski/x/y.txt"), &err));
  }

  // Level files
  {
    app::GameSession s;
    assert(s.start(0));
    std::string err;
    assert(s.loadLevelFile(std::string(KLOTSKI_LEVELS_DIR) + "/level1.dat", &err));
    assert(s.snapshot() == "G C C G \nG C C G \n. S Y Y \nG S S G \nG . S G \n");
    const auto res = s.solve();
    assert(res.path && res.path->size() == 111);

    assert(s.loadLevelFile(std::string(KLOTSKI_LEVELS_DIR) + "/level2.dat", &err));
    assert(s.solve().path->size() == 109);
    assert(s.loadLevelFile(std::string(KLOTSKI_LEVELS_DIR) + "/level3.dat", &err));
    assert(s.solve().path->size() == 113);
  }

  // Reloading a blocked variant keeps the lock on the same cell
  {
    app::GameSession s;
    assert(s.start(3));
    const core::Coord lockedAt = s.game().getBoard().findById(3)->position();
    assert(lockedAt == (core::Coord{0, 3}));
    assert(s.play({3, 0}, {4, 0}));
    assert(s.play({1, 0}, {2, 0}));
    const std::string text = s.snapshot();
    assert(text == ". C C G \nG C C G \nG Y Y . \nG S S . \nG S S . \n");

    std::string err;
    assert(s.loadSnapshot(text, &err));
    assert(s.snapshot() == text);
    assert(s.game().getBlockedId() == 3);
    assert(s.game().getBoard().findById(3)->position() == lockedAt);
    assert(s.game().getBoard().findById(2)->position() == (core::Coord{1, 0}));
    assert(!s.play({1, 3}, {2, 3}));

    // Same through a file.
    const std::string path = tempPath("klotski_locked_reload.txt");
    assert(s.saveToFile(path, &err));
    s.restart();
    assert(s.loadFromFile(path, &err));
    std::filesystem::remove(path);
    assert(s.game().getBoard().findById(3)->position() == lockedAt);
    assert(!s.play({1, 3}, {2, 3}));
    assert(s.play({1, 0}, {0, 0}));

    // Solutions found after the reload leave the locked general in place.
    const auto res = s.solve();
    assert(res.path);
    model::KlotskiGame replay = s.game();
    for (const auto& m : *res.path)
    {
      assert(replay.getBoard().getPieceAt(m.from)->id() != 3);
      assert(replay.applyAction(m));
    }
    assert(replay.isTerminal());
    assert(replay.getBoard().findById(3)->position() == lockedAt);
  }

  // Snapshot text straight from memory
  {
    app::GameSession s;
    std::string err;
    assert(!s.loadSnapshot("G C C G", &err));
    assert(s.snapshot() == core::CLASSIC_BOARD);
    assert(s.loadSnapshot("C C Y Y \nC C S S \nG G G G \nG G G G \nS S . .", &err));
    assert(!s.isSolved());
  }

  std::cout << "session_test passed\n";
  return 0;
}
