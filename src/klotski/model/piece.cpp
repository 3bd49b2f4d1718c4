#include "klotski/model/piece.hpp"

#include <utility>

namespace klotski::model {

Piece::Piece(core::PieceId id, std::string name, char abbreviation, int width, int height,
             core::Coord position)
    : m_id(id),
      m_name(std::move(name)),
      m_abbreviation(abbreviation),
      m_width(width),
      m_height(height),
      m_position(position) {}

Piece Piece::fromCatalogue(core::PieceId id, core::Coord position) {
  const PieceSpec& spec = PIECE_CATALOGUE[static_cast<std::size_t>(id)];
  return Piece(spec.id, std::string(spec.name), abbreviationOf(spec.kind), spec.width,
               spec.height, position);
}

std::string Piece::toString() const {
  std::string out;
  out.reserve(64);
  out.append(m_name);
  out.append(" (ID: ");
  out.append(std::to_string(m_id));
  out.append(", Position: [");
  out.append(std::to_string(m_position.row));
  out.push_back(',');
  out.append(std::to_string(m_position.col));
  out.append("], Size: ");
  out.append(std::to_string(m_width));
  out.push_back('x');
  out.append(std::to_string(m_height));
  out.push_back(')');
  return out;
}

}  // namespace klotski::model
