#pragma once
#include <string>
#include <string_view>

#include "board.hpp"

namespace klotski::model
{
  // HEIGHT lines of WIDTH cells; every cell is followed by one space and every line
  // ends with '\n'. Empty cells are '.', occupied cells carry the piece abbreviation.
  std::string boardToText(const Board &b);

  // Re-maps the positions of the pieces present in `b` onto the grid described by `text`
  // (greedy first fit in storage order, scanning top-left to bottom-right). Absent pieces
  // stay absent. On failure returns false, fills `err` and leaves `b` untouched.
  bool boardFromText(std::string_view text, Board &b, std::string *err = nullptr);
}
