#include "klotski/model/board.hpp"

namespace klotski::model {

const Piece* Board::findById(core::PieceId id) const noexcept {
  for (const auto& p : m_pieces) {
    if (p.id() == id) return &p;
  }
  return nullptr;
}

Piece* Board::findById(core::PieceId id) noexcept {
  for (auto& p : m_pieces) {
    if (p.id() == id) return &p;
  }
  return nullptr;
}

const Piece* Board::getPieceAt(core::Coord cell) const noexcept {
  if (!core::inBounds(cell)) return nullptr;
  for (const auto& p : m_pieces) {
    if (p.isPresent() && p.covers(cell)) return &p;
  }
  return nullptr;
}

Piece* Board::getPieceAt(core::Coord cell) noexcept {
  if (!core::inBounds(cell)) return nullptr;
  for (auto& p : m_pieces) {
    if (p.isPresent() && p.covers(cell)) return &p;
  }
  return nullptr;
}

const Piece* Board::getPieceAtPrecise(core::Coord cell) const noexcept {
  for (const auto& p : m_pieces) {
    if (p.position() == cell) return &p;
  }
  return nullptr;
}

bool Board::overlaps(const Piece& piece, core::Coord pos, int width, int height) noexcept {
  const core::Coord p = piece.position();
  return !(pos.row >= p.row + piece.height() || pos.row + height <= p.row ||
           pos.col >= p.col + piece.width() || pos.col + width <= p.col);
}

bool Board::fits(core::Coord pos, int width, int height) noexcept {
  return pos.row >= 0 && pos.row + height <= core::BOARD_HEIGHT && pos.col >= 0 &&
         pos.col + width <= core::BOARD_WIDTH;
}

bool Board::collides(const Piece& mover, core::Coord pos) const noexcept {
  for (const auto& other : m_pieces) {
    if (&other == &mover || !other.isPresent()) continue;
    if (overlaps(other, pos, mover.width(), mover.height())) return true;
  }
  return false;
}

bool Board::isConsistent() const noexcept {
  for (std::size_t i = 0; i < m_pieces.size(); ++i) {
    const Piece& a = m_pieces[i];
    if (!a.isPresent()) continue;
    if (!fits(a.position(), a.width(), a.height())) return false;
    for (std::size_t j = i + 1; j < m_pieces.size(); ++j) {
      const Piece& b = m_pieces[j];
      if (!b.isPresent()) continue;
      if (overlaps(b, a.position(), a.width(), a.height())) return false;
    }
  }
  return true;
}

}  // namespace klotski::model
