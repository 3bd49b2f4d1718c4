#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "klotski/core/types.hpp"
#include "klotski/model/klotski_game.hpp"
#include "klotski/model/move.hpp"
#include "klotski/model/variant.hpp"

using namespace klotski;

static model::Move mv(int fr, int fc, int tr, int tc)
{
  return model::Move{core::Coord{fr, fc}, core::Coord{tr, tc}};
}

int main()
{
  // Classic start: only Cao Cao down and Guan Yu up
  {
    model::KlotskiGame game;
    const auto& moves = game.getLegalMoves();
    assert(moves.size() == 2);
    assert(moves[0] == mv(0, 1, 1, 1));
    assert(moves[1] == mv(3, 1, 2, 1));

    const auto& down = game.getLegalMovesByDirection(core::DOWN);
    assert(down.size() == 1 && down[0] == mv(0, 1, 1, 1));
    const auto& up = game.getLegalMovesByDirection(core::UP);
    assert(up.size() == 1 && up[0] == mv(3, 1, 2, 1));
    assert(game.getLegalMovesByDirection(core::LEFT).empty());
    assert(game.getLegalMovesByDirection(core::RIGHT).empty());
    assert(!game.isTerminal());
  }

  // Per-piece queries: none / stuck / destinations
  {
    model::KlotskiGame game;
    const auto cao = game.getLegalMovesForPiece({1, 1});
    assert(cao && cao->size() == 1 && (*cao)[0] == (core::Coord{2, 1}));

    const auto stuck = game.getLegalMovesForPiece({0, 0});
    assert(stuck && stuck->empty());

    assert(!game.getLegalMovesForPiece({2, 1}));
    assert(!game.getLegalMovesForPiece({5, 0}));
    assert(!game.getLegalMovesForPiece({-1, -1}));
  }

  // Illegal actions are silent no-ops
  {
    model::KlotskiGame game;
    const std::string before = game.toString();
    assert(!game.applyAction({0, 0}, {1, 0}));   // blocked by General 3
    assert(!game.applyAction({3, 1}, {1, 1}));   // two cells
    assert(!game.applyAction({3, 1}, {2, 2}));   // diagonal
    assert(!game.applyAction({2, 1}, {2, 2}));   // empty source
    assert(!game.applyAction({4, 0}, {5, 0}));   // off the grid
    assert(!game.applyAction({0, 1}, {0, 1}));   // zero delta
    assert(game.getMoveCount() == 0);
    assert(game.toString() == before);
  }

  // Any covered cell drags the whole piece
  {
    model::KlotskiGame game;
    assert(game.isLegalMove({1, 2}, {2, 2}));
    assert(game.applyAction({1, 2}, {2, 2}));
    assert(game.getMoveCount() == 1);
    assert(game.getBoard().findById(0)->position() == (core::Coord{1, 1}));
    assert(game.toString() == "G . . G \nG C C G \nG C C G \nG Y Y G \nS S S S \n");

    // Reverse step puts it back; the count keeps growing.
    assert(game.applyAction({2, 1}, {1, 1}));
    assert(!game.applyAction({0, 1}, {-1, 1}));
    assert(game.getMoveCount() == 2);
    assert(game.getBoard().findById(0)->position() == (core::Coord{0, 1}));
    assert(game.getBoard().isConsistent());
  }

  // Blocked piece: bulk queries still list it, playable and per-piece queries do not
  {
    model::KlotskiGame game(*model::findVariant(1));
    assert(game.getBlockedId() == 9);
    const model::Move soldierUp = mv(4, 3, 3, 3);

    bool listed = false;
    for (const auto& m : game.getLegalMoves())
      listed = listed || m == soldierUp;
    assert(listed);

    for (const auto& m : game.getPlayableMoves())
      assert(m != soldierUp);

    assert(!game.getLegalMovesForPiece({4, 3}));
    const auto g2 = game.getLegalMovesForPiece({1, 3});
    assert(g2 && g2->size() == 1 && (*g2)[0] == (core::Coord{2, 3}));

    game.setBlockedId(core::NO_PIECE);
    assert(game.getLegalMovesForPiece({4, 3}));
  }

  // Win detection: Cao Cao's top-left on (3,1)
  {
    model::KlotskiGame game;
    auto pieces = game.getPieces();
    pieces[0].setPosition({3, 1});
    pieces[1].setPosition({0, 1});
    pieces[7].setPosition({1, 1});
    pieces[8].setPosition({1, 2});
    game.setPieces(pieces);
    assert(game.getBoard().isConsistent());
    assert(game.isTerminal());
    assert(game.toString() == "G Y Y G \nG S S G \nG . . G \nG C C G \nS C C S \n");

    // Moving other pieces keeps the win.
    assert(game.applyAction({1, 1}, {2, 1}));
    assert(game.applyAction({1, 2}, {2, 2}));
    assert(game.isTerminal());
  }

  // Move descriptions
  {
    model::KlotskiGame game;
    const model::Move m = mv(3, 1, 2, 1);
    const std::string text = game.describeMove(m);
    assert(text == "Move Guan Yu from (3,1) to (2,1)");
    const auto parsed = model::parseMoveDescription(text);
    assert(parsed && *parsed == m);

    assert(game.describeMove(mv(4, 2, 3, 2)) == "Move Soldier 3 from (4,2) to (3,2)");
    assert(!model::parseMoveDescription("Move Guan Yu from 3,1 to (2,1)"));
    assert(!model::parseMoveDescription("Guan Yu from (3,1) to (2,1)"));
    assert(!model::parseMoveDescription("Move Guan Yu from (3,1)"));
    assert(!model::parseMoveDescription("Move Guan Yu from (a,1) to (2,1)"));
    assert(!model::parseMoveDescription("Move X from (99999999999,1) to (2,1)"));
    assert(!model::parseMoveDescription("Move X from (3,1) to (2,100)"));
    const auto twoDigits = model::parseMoveDescription("Move X from (10,1) to (2,1)");
    assert(twoDigits && twoDigits->from == (core::Coord{10, 1}));
  }

  // Read-only callers get their own copies
  {
    model::KlotskiGame game(*model::findVariant(1));
    const model::KlotskiGame& view = game;
    const std::vector<model::Move> all = view.getLegalMoves();
    const std::vector<model::Move> playable = view.getPlayableMoves();
    const std::vector<model::Move> up = view.getLegalMovesByDirection(core::UP);
    assert(all.size() == playable.size() + 1);
    assert(all == game.getLegalMoves());
    assert(playable == game.getPlayableMoves());
    assert(up.size() == 2 && up[0] == mv(3, 1, 2, 1) && up[1] == mv(4, 3, 3, 3));
    // The cache was rewritten in between; the copies are unaffected.
    const auto& down = game.getLegalMovesByDirection(core::DOWN);
    assert(down.size() == 2 && down[0] == mv(0, 1, 1, 1));
    assert(view.getLegalMovesByDirection(core::UP) == up);
    assert(all == view.getLegalMoves());
  }

  // Move value type
  {
    const model::Move m = mv(2, 2, 2, 3);
    assert(m.isStep());
    assert(m.delta() == core::RIGHT);
    assert(m.reversed() == mv(2, 3, 2, 2));
    assert(!mv(0, 0, 1, 1).isStep());
    assert(!mv(0, 0, 0, 0).isStep());
  }

  std::cout << "move_engine_test passed\n";
  return 0;
}
