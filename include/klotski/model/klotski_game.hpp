#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../constants.hpp"
#include "board.hpp"
#include "move.hpp"
#include "move_generator.hpp"
#include "variant.hpp"

namespace klotski::model {

// Puzzle engine for one board: move queries, action application, win detection,
// text serialization and seeded shuffling. Single-threaded; callers that share an
// instance across threads must serialize access themselves.
class KlotskiGame {
 public:
  KlotskiGame();
  explicit KlotskiGame(const Variant& variant);

  // Resets pieces, blocked piece and move count to the given layout.
  void initialize(const Variant& variant);
  void initialize();  // classic
  // Variant by id; false (nothing changed) if there is no such variant.
  bool initialize(int variantId);

  // Applies the move if legal; otherwise a silent no-op. Returns whether it was applied.
  bool applyAction(core::Coord from, core::Coord to);
  bool applyAction(const Move& m) { return applyAction(m.from, m.to); }
  [[nodiscard]] bool isLegalMove(core::Coord from, core::Coord to) const;

  // nullopt: no piece at `cell`, piece off the grid, or the blocked piece.
  // Empty vector: piece present but stuck.
  std::optional<std::vector<core::Coord>> getLegalMovesForPiece(core::Coord cell) const;

  // Bulk queries over all pieces; they do not honor the blocked piece.
  // The returned list is a shared cache: the next bulk query or any board change
  // invalidates it. The const overloads return a fresh copy instead.
  const std::vector<Move>& getLegalMovesByDirection(core::Direction dir);
  const std::vector<Move>& getLegalMoves();
  std::vector<Move> getLegalMovesByDirection(core::Direction dir) const;
  std::vector<Move> getLegalMoves() const;
  // Bulk query with the blocked piece's moves filtered out.
  const std::vector<Move>& getPlayableMoves();
  std::vector<Move> getPlayableMoves() const;

  [[nodiscard]] bool isTerminal() const;

  std::string toString() const;
  // Positions are re-mapped by first fit; if that moves the blocked piece off its cell
  // onto a same-shaped twin's, the two trade places so the locked cell stays locked.
  bool fromString(std::string_view text, std::string* err = nullptr);

  // Seeded random walk of at most SHUFFLE_STEPS legal moves.
  void randomShuffle(std::int64_t seed);
  void randomShuffle();

  [[nodiscard]] int getMoveCount() const noexcept { return m_move_count; }
  [[nodiscard]] core::PieceId getBlockedId() const noexcept { return m_blocked_id; }
  void setBlockedId(core::PieceId id) noexcept { m_blocked_id = id; }
  [[nodiscard]] int getVariantId() const noexcept { return m_variant_id; }

  std::vector<Piece> getPieces() const { return m_board.pieces(); }
  const Piece& getPiece(std::size_t index) const { return m_board.piece(index); }
  // Bulk replacement; throws std::invalid_argument on a count mismatch or an entry that
  // does not match the catalogue identity of its slot. Never partially applied.
  void setPieces(const std::vector<Piece>& pieces);

  const Board& getBoard() const noexcept { return m_board; }

  // "Move <name> from (r,c) to (r,c)" for the piece under `m.from`.
  std::string describeMove(const Move& m) const;

 private:
  MoveGenerator m_move_gen;
  Board m_board;
  int m_move_count = 0;
  core::PieceId m_blocked_id = core::NO_PIECE;
  int m_variant_id = 0;
  std::vector<Move> m_legal_moves;
};

// Parses the describeMove() text back into a move.
std::optional<Move> parseMoveDescription(std::string_view text);

}  // namespace klotski::model
