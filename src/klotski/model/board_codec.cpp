#include "klotski/model/board_codec.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "klotski/constants.hpp"

namespace klotski::model
{
  namespace
  {
    using Grid = std::array<std::array<char, core::BOARD_WIDTH>, core::BOARD_HEIGHT>;

    static bool isSpace(char c)
    {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    static std::string_view trim(std::string_view sv)
    {
      while (!sv.empty() && isSpace(sv.front()))
        sv.remove_prefix(1);
      while (!sv.empty() && isSpace(sv.back()))
        sv.remove_suffix(1);
      return sv;
    }

    static std::vector<std::string_view> splitLines(std::string_view sv)
    {
      std::vector<std::string_view> out;
      while (true)
      {
        const std::size_t nl = sv.find('\n');
        if (nl == std::string_view::npos)
        {
          out.push_back(sv);
          break;
        }
        out.push_back(sv.substr(0, nl));
        sv.remove_prefix(nl + 1);
      }
      return out;
    }

    static std::vector<std::string_view> splitCells(std::string_view sv)
    {
      std::vector<std::string_view> out;
      std::size_t i = 0;
      while (i < sv.size())
      {
        while (i < sv.size() && isSpace(sv[i]))
          ++i;
        const std::size_t start = i;
        while (i < sv.size() && !isSpace(sv[i]))
          ++i;
        if (i > start)
          out.push_back(sv.substr(start, i - start));
      }
      return out;
    }

    static bool knownSymbol(char c)
    {
      return c == core::EMPTY_CELL || c == 'C' || c == 'Y' || c == 'G' || c == 'S';
    }

    static void setErr(std::string *err, std::string msg)
    {
      if (err)
        *err = std::move(msg);
    }

    static std::string cellLabel(char c, int row, int col)
    {
      std::string s = "'";
      s.push_back(c);
      s += "' at row " + std::to_string(row) + ", col " + std::to_string(col) + ".";
      return s;
    }

    static bool fitsAt(const Grid &g, const Piece &p, int row, int col, char symbol)
    {
      for (int i = 0; i < p.height(); ++i)
      {
        for (int j = 0; j < p.width(); ++j)
        {
          const int r = row + i;
          const int c = col + j;
          if (r >= core::BOARD_HEIGHT || c >= core::BOARD_WIDTH || g[r][c] != symbol)
            return false;
        }
      }
      return true;
    }
  } // namespace

  std::string boardToText(const Board &b)
  {
    Grid grid;
    for (auto &row : grid)
      row.fill(core::EMPTY_CELL);

    for (const auto &p : b.pieces())
    {
      if (!p.isPresent())
        continue;
      for (int i = 0; i < p.height(); ++i)
      {
        for (int j = 0; j < p.width(); ++j)
        {
          const core::Coord cell{p.row() + i, p.col() + j};
          if (core::inBounds(cell))
            grid[cell.row][cell.col] = p.abbreviation();
        }
      }
    }

    std::string out;
    out.reserve(core::BOARD_HEIGHT * (core::BOARD_WIDTH * 2 + 1));
    for (const auto &row : grid)
    {
      for (char c : row)
      {
        out.push_back(c);
        out.push_back(' ');
      }
      out.push_back('\n');
    }
    return out;
  }

  bool boardFromText(std::string_view text, Board &b, std::string *err)
  {
    const auto rows = splitLines(trim(text));
    if (rows.size() != static_cast<std::size_t>(core::BOARD_HEIGHT))
    {
      setErr(err, "Invalid board height. Expected " + std::to_string(core::BOARD_HEIGHT) +
                      " rows.");
      return false;
    }

    Grid grid;
    for (int r = 0; r < core::BOARD_HEIGHT; ++r)
    {
      const auto cells = splitCells(rows[r]);
      if (cells.size() != static_cast<std::size_t>(core::BOARD_WIDTH))
      {
        setErr(err, "Invalid board width at row " + std::to_string(r) + ". Expected " +
                        std::to_string(core::BOARD_WIDTH) + " columns.");
        return false;
      }
      for (int c = 0; c < core::BOARD_WIDTH; ++c)
      {
        const char symbol = cells[c].front();
        if (cells[c].size() != 1 || !knownSymbol(symbol))
        {
          setErr(err, "Unknown cell symbol " + cellLabel(symbol, r, c));
          return false;
        }
        grid[r][c] = symbol;
      }
    }

    // Work on a copy so that a failed parse leaves the board as it was.
    std::vector<Piece> pieces = b.pieces();
    std::vector<bool> pending(pieces.size(), false);
    for (std::size_t k = 0; k < pieces.size(); ++k)
    {
      pending[k] = pieces[k].isPresent();
      if (pending[k])
        pieces[k].setPosition(core::OFF_BOARD);
    }

    for (int row = 0; row < core::BOARD_HEIGHT; ++row)
    {
      for (int col = 0; col < core::BOARD_WIDTH; ++col)
      {
        const char symbol = grid[row][col];
        if (symbol == core::EMPTY_CELL)
          continue;

        for (std::size_t k = 0; k < pieces.size(); ++k)
        {
          Piece &p = pieces[k];
          if (!pending[k] || p.abbreviation() != symbol)
            continue;
          if (!fitsAt(grid, p, row, col, symbol))
            continue;

          p.setPosition(core::Coord{row, col});
          pending[k] = false;
          for (int i = 0; i < p.height(); ++i)
            for (int j = 0; j < p.width(); ++j)
              grid[row + i][col + j] = core::EMPTY_CELL;
          break;
        }
      }
    }

    for (std::size_t k = 0; k < pieces.size(); ++k)
    {
      if (pending[k])
      {
        setErr(err, "Piece " + pieces[k].name() + " could not be placed on the board.");
        return false;
      }
    }

    for (int row = 0; row < core::BOARD_HEIGHT; ++row)
    {
      for (int col = 0; col < core::BOARD_WIDTH; ++col)
      {
        if (grid[row][col] != core::EMPTY_CELL)
        {
          setErr(err, "Unmatched cell " + cellLabel(grid[row][col], row, col));
          return false;
        }
      }
    }

    b.pieces() = std::move(pieces);
    return true;
  }
} // namespace klotski::model
