#pragma once

#include <string>
#include <string_view>

namespace klotski::core
{
  // Serialized classic start board (one cell + one space per column, one line per row).
  const std::string CLASSIC_BOARD = "G C C G \n"
                                    "G C C G \n"
                                    "G . . G \n"
                                    "G Y Y G \n"
                                    "S S S S \n";

  constexpr char EMPTY_CELL = '.';
  constexpr int SHUFFLE_STEPS = 100;

  // ------------------ Version ------------------
  inline constexpr std::string_view KLOTSKI_VERSION{"Klotski 1.0v"};
}
