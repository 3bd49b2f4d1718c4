#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "../core/types.hpp"
#include "piece.hpp"

namespace klotski::model {

// Fixed 4x5 grid holding an ordered arena of pieces. Piece identities are stable;
// only positions are mutated in place.
class Board {
 public:
  Board() = default;
  explicit Board(std::vector<Piece> pieces) : m_pieces(std::move(pieces)) {}

  [[nodiscard]] std::size_t pieceCount() const noexcept { return m_pieces.size(); }
  [[nodiscard]] const std::vector<Piece>& pieces() const noexcept { return m_pieces; }
  std::vector<Piece>& pieces() noexcept { return m_pieces; }

  const Piece& piece(std::size_t index) const { return m_pieces.at(index); }
  Piece& piece(std::size_t index) { return m_pieces.at(index); }

  // Linear lookup by id; nullptr if no such piece.
  const Piece* findById(core::PieceId id) const noexcept;
  Piece* findById(core::PieceId id) noexcept;

  // Piece whose rectangle contains `cell` (first match in storage order), or nullptr.
  // Cells outside the grid never hold a piece.
  const Piece* getPieceAt(core::Coord cell) const noexcept;
  Piece* getPieceAt(core::Coord cell) noexcept;

  // Piece whose top-left corner equals `cell` exactly, or nullptr.
  const Piece* getPieceAtPrecise(core::Coord cell) const noexcept;

  // Axis-aligned rectangle intersection of `piece` against the candidate rectangle
  // [pos.row,pos.row+height) x [pos.col,pos.col+width).
  [[nodiscard]] static bool overlaps(const Piece& piece, core::Coord pos, int width,
                                     int height) noexcept;

  // Full rectangle lies inside the grid.
  [[nodiscard]] static bool fits(core::Coord pos, int width, int height) noexcept;

  // True if `pos` (with the shape of `mover`) collides with a present piece other than `mover`.
  [[nodiscard]] bool collides(const Piece& mover, core::Coord pos) const noexcept;

  // Quiescent-state invariant: present pieces in bounds and pairwise disjoint.
  [[nodiscard]] bool isConsistent() const noexcept;

 private:
  std::vector<Piece> m_pieces;
};

}  // namespace klotski::model
