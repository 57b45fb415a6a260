#include "grid.h"
#include "solver_errors.h"

Grid NormalizeGrid(const Board& board, const std::string& parameter,
                   const CellNormalizer& normalize) {
  Grid grid;
  if (board.empty()) return grid;

  const size_t width = board[0].size();
  for (const auto& row : board) {
    if (row.size() != width) {
      throw InvalidParameters(parameter, "Not all rows are the same size.");
    }
  }

  for (size_t index = 0; index < board.size(); ++index) {
    std::string line;
    for (const std::string& cell : board[index]) {
      std::string letter = normalize(cell);
      if (letter.size() != 1) {
        throw InvalidParameters(parameter, "Row " + std::to_string(index) +
                                " cannot convert '" + cell + "' into a letter.");
      }
      line += letter;
    }
    grid.push_back(line);
  }
  return grid;
}

Grid Transpose(const Grid& grid) {
  const int width = GridWidth(grid);
  Grid out(width, std::string(grid.size(), ' '));
  for (size_t y = 0; y < grid.size(); ++y) {
    for (int x = 0; x < width; ++x) {
      out[x][y] = grid[y][x];
    }
  }
  return out;
}

int GridWidth(const Grid& grid) {
  return grid.empty() ? 0 : (int)grid[0].size();
}
