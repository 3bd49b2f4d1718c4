#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "../core/types.hpp"

namespace klotski::model {

enum class PieceKind : std::uint8_t { Primary = 0, Secondary, General, Soldier };

[[nodiscard]] constexpr char abbreviationOf(PieceKind k) noexcept {
  switch (k) {
    case PieceKind::Primary:
      return 'C';
    case PieceKind::Secondary:
      return 'Y';
    case PieceKind::General:
      return 'G';
    case PieceKind::Soldier:
      return 'S';
  }
  return '?';
}

// Fixed identity of a catalogue slot; only the position of a piece ever changes.
struct PieceSpec {
  core::PieceId id;
  std::string_view name;
  PieceKind kind;
  int width;
  int height;
};

inline constexpr std::array<PieceSpec, core::PIECE_COUNT> PIECE_CATALOGUE{{
    {0, "Cao Cao", PieceKind::Primary, 2, 2},
    {1, "Guan Yu", PieceKind::Secondary, 2, 1},
    {2, "General 1", PieceKind::General, 1, 2},
    {3, "General 2", PieceKind::General, 1, 2},
    {4, "General 3", PieceKind::General, 1, 2},
    {5, "General 4", PieceKind::General, 1, 2},
    {6, "Soldier 1", PieceKind::Soldier, 1, 1},
    {7, "Soldier 2", PieceKind::Soldier, 1, 1},
    {8, "Soldier 3", PieceKind::Soldier, 1, 1},
    {9, "Soldier 4", PieceKind::Soldier, 1, 1},
}};

class Piece {
 public:
  Piece() = default;
  Piece(core::PieceId id, std::string name, char abbreviation, int width, int height,
        core::Coord position);

  // Catalogue piece for slot `id` placed at `position`.
  static Piece fromCatalogue(core::PieceId id, core::Coord position);

  [[nodiscard]] core::PieceId id() const noexcept { return m_id; }
  [[nodiscard]] const std::string& name() const noexcept { return m_name; }
  [[nodiscard]] char abbreviation() const noexcept { return m_abbreviation; }
  [[nodiscard]] int width() const noexcept { return m_width; }
  [[nodiscard]] int height() const noexcept { return m_height; }
  [[nodiscard]] int size() const noexcept { return m_width * m_height; }

  [[nodiscard]] core::Coord position() const noexcept { return m_position; }
  [[nodiscard]] int row() const noexcept { return m_position.row; }
  [[nodiscard]] int col() const noexcept { return m_position.col; }
  void setPosition(core::Coord pos) noexcept { m_position = pos; }

  // Absent pieces sit at OFF_BOARD and take part in nothing.
  [[nodiscard]] bool isPresent() const noexcept { return m_position != core::OFF_BOARD; }

  // True if `cell` lies inside [row,row+height) x [col,col+width).
  [[nodiscard]] bool covers(core::Coord cell) const noexcept {
    return cell.row >= m_position.row && cell.row < m_position.row + m_height &&
           cell.col >= m_position.col && cell.col < m_position.col + m_width;
  }

  // Same catalogue identity (id, shape, abbreviation), position ignored.
  [[nodiscard]] bool sameIdentity(const Piece& other) const noexcept {
    return m_id == other.m_id && m_abbreviation == other.m_abbreviation &&
           m_width == other.m_width && m_height == other.m_height;
  }

  std::string toString() const;

 private:
  core::PieceId m_id = core::NO_PIECE;
  std::string m_name;
  char m_abbreviation = '?';
  int m_width = 0;
  int m_height = 0;
  core::Coord m_position = core::OFF_BOARD;
};

}  // namespace klotski::model
