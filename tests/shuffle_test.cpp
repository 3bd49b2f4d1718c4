#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "klotski/constants.hpp"
#include "klotski/model/core/random.hpp"
#include "klotski/model/klotski_game.hpp"
#include "klotski/model/variant.hpp"

using namespace klotski;

int main()
{
  // Reference SplitMix64 stream
  {
    model::random::SplitMix64 rng(0);
    assert(rng.next() == 0xE220A8397B1DCDAFULL);
    assert(rng.next() == 0x6E789E6AA1B965F4ULL);
  }

  // Fixed seeds give fixed boards
  {
    model::KlotskiGame game;
    game.randomShuffle(10101);
    assert(game.getMoveCount() == core::SHUFFLE_STEPS);
    assert(game.toString() == "G C C G \nG C C G \nG . S G \nG Y Y G \n. S S S \n");
    assert(game.getBoard().isConsistent());

    model::KlotskiGame other;
    other.randomShuffle(42);
    assert(other.toString() == "G C C G \nG C C G \nY Y S . \nG . S G \nG S S G \n");
  }

  // Same seed, same walk
  {
    for (std::int64_t seed : {0LL, 7LL, 123456789LL, -5LL})
    {
      model::KlotskiGame a;
      model::KlotskiGame b;
      a.randomShuffle(seed);
      b.randomShuffle(seed);
      assert(a.toString() == b.toString());
      assert(a.getPieces().size() == b.getPieces().size());
      for (std::size_t i = 0; i < a.getPieces().size(); ++i)
        assert(a.getPiece(i).position() == b.getPiece(i).position());
    }
  }

  // Shuffling continues from the current board
  {
    model::KlotskiGame game;
    game.randomShuffle(1);
    const std::string once = game.toString();
    game.randomShuffle(1);
    assert(game.getMoveCount() == 2 * core::SHUFFLE_STEPS);
    assert(game.getBoard().isConsistent());

    model::KlotskiGame replay;
    replay.randomShuffle(1);
    assert(replay.toString() == once);
  }

  // A board without legal moves stops immediately
  {
    model::KlotskiGame game;
    auto pieces = game.getPieces();
    for (auto& p : pieces)
      p.setPosition(core::OFF_BOARD);
    game.setPieces(pieces);
    assert(game.getLegalMoves().empty());

    game.randomShuffle(10101);
    assert(game.getMoveCount() == 0);
    assert(game.toString() == ". . . . \n. . . . \n. . . . \n. . . . \n. . . . \n");
  }

  // Clock-seeded overload still produces a legal board
  {
    model::KlotskiGame game(*model::findVariant(3));
    game.randomShuffle();
    assert(game.getMoveCount() == core::SHUFFLE_STEPS);
    assert(game.getBoard().isConsistent());
    assert(!game.getBoard().findById(5)->isPresent());
  }

  std::cout << "shuffle_test passed\n";
  return 0;
}
