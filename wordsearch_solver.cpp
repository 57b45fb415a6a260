#include "wordsearch_solver.h"
#include "solver_errors.h"
#include "word_list.h"
#include <algorithm>

namespace {

std::vector<Slice> SlicesNorth(int width, int height) {
  std::vector<Slice> slices;
  for (int col = 0; col < width; ++col) {
    Slice slice;
    for (int row = height - 1; row >= 0; --row) {
      slice.push_back(Coord(col, row));
    }
    slices.push_back(slice);
  }
  return slices;
}

//Anti-diagonals (row + col == diag), read bottom-left to top-right
std::vector<Slice> SlicesNorthEast(int width, int height) {
  std::vector<Slice> slices;
  for (int diag = 0; diag < width + height - 1; ++diag) {
    Slice slice;
    for (int col = std::max(0, 1 - height + diag); col < std::min(width, diag + 1); ++col) {
      slice.push_back(Coord(col, diag - col));
    }
    slices.push_back(slice);
  }
  return slices;
}

std::vector<Slice> SlicesEast(int width, int height) {
  std::vector<Slice> slices;
  for (int row = 0; row < height; ++row) {
    Slice slice;
    for (int col = 0; col < width; ++col) {
      slice.push_back(Coord(col, row));
    }
    slices.push_back(slice);
  }
  return slices;
}

//Diagonals (row - col constant), read top-left to bottom-right
std::vector<Slice> SlicesSouthEast(int width, int height) {
  std::vector<Slice> slices;
  for (int diag = 0; diag < width + height - 1; ++diag) {
    Slice slice;
    for (int col = std::max(0, 1 - height + diag); col < std::min(width, diag + 1); ++col) {
      slice.push_back(Coord(col, col - diag + height - 1));
    }
    slices.push_back(slice);
  }
  return slices;
}

std::vector<Slice> SlicesSouth(int width, int height) {
  std::vector<Slice> slices;
  for (int col = 0; col < width; ++col) {
    Slice slice;
    for (int row = 0; row < height; ++row) {
      slice.push_back(Coord(col, row));
    }
    slices.push_back(slice);
  }
  return slices;
}

std::vector<Slice> SlicesSouthWest(int width, int height) {
  std::vector<Slice> slices;
  for (int diag = 0; diag < width + height - 1; ++diag) {
    Slice slice;
    for (int col = std::min(width, diag + 1) - 1; col >= std::max(0, 1 - height + diag); --col) {
      slice.push_back(Coord(col, diag - col));
    }
    slices.push_back(slice);
  }
  return slices;
}

std::vector<Slice> SlicesWest(int width, int height) {
  std::vector<Slice> slices;
  for (int row = 0; row < height; ++row) {
    Slice slice;
    for (int col = width - 1; col >= 0; --col) {
      slice.push_back(Coord(col, row));
    }
    slices.push_back(slice);
  }
  return slices;
}

std::vector<Slice> SlicesNorthWest(int width, int height) {
  std::vector<Slice> slices;
  for (int diag = 0; diag < width + height - 1; ++diag) {
    Slice slice;
    for (int col = std::min(width, diag + 1) - 1; col >= std::max(0, 1 - height + diag); --col) {
      slice.push_back(Coord(col, col - diag + height - 1));
    }
    slices.push_back(slice);
  }
  return slices;
}

}  // namespace

const std::vector<Direction>& AllDirections() {
  static const std::vector<Direction> all = {
    Direction::North, Direction::NorthEast, Direction::East, Direction::SouthEast,
    Direction::South, Direction::SouthWest, Direction::West, Direction::NorthWest
  };
  return all;
}

const char* DirectionName(Direction direction) {
  switch (direction) {
    case Direction::North: return "N";
    case Direction::NorthEast: return "NE";
    case Direction::East: return "E";
    case Direction::SouthEast: return "SE";
    case Direction::South: return "S";
    case Direction::SouthWest: return "SW";
    case Direction::West: return "W";
    case Direction::NorthWest: return "NW";
  }
  return "";
}

Direction ParseDirection(const std::string& name) {
  const std::string upper = ToUpper(name);
  for (Direction direction : AllDirections()) {
    if (upper == DirectionName(direction)) return direction;
  }
  throw InvalidParameters("directions",
                          "Permitted directions are N, NW, W, SW, S, SE, E, NE or ALL, received '" +
                          name + "'.");
}

std::vector<Slice> GridSlices(Direction direction, int width, int height) {
  switch (direction) {
    case Direction::North: return SlicesNorth(width, height);
    case Direction::NorthEast: return SlicesNorthEast(width, height);
    case Direction::East: return SlicesEast(width, height);
    case Direction::SouthEast: return SlicesSouthEast(width, height);
    case Direction::South: return SlicesSouth(width, height);
    case Direction::SouthWest: return SlicesSouthWest(width, height);
    case Direction::West: return SlicesWest(width, height);
    case Direction::NorthWest: return SlicesNorthWest(width, height);
  }
  return std::vector<Slice>();
}

WordSearchSolver::WordSearchSolver(const std::vector<std::string>& words) {
  for (const std::string& word : words) {
    trie.add(ToUpper(word));
  }
}

std::vector<WordSearchHit> WordSearchSolver::solve(const Board& grid) const {
  return solve(grid, AllDirections());
}

std::vector<WordSearchHit> WordSearchSolver::solve(const Board& grid,
                                                   const std::vector<std::string>& directions) const {
  std::vector<Direction> wanted;
  for (const std::string& name : directions) {
    if (ToUpper(name) == "ALL") return solve(grid, AllDirections());
    wanted.push_back(ParseDirection(name));
  }
  if (wanted.empty()) return solve(grid, AllDirections());
  return solve(grid, wanted);
}

std::vector<WordSearchHit> WordSearchSolver::solve(const Board& grid,
                                                   const std::vector<Direction>& directions) const {
  Grid letters = NormalizeGrid(grid, "grid", [](const std::string& cell) {
    return ToUpper(cell);
  });
  const int width = GridWidth(letters);
  const int height = (int)letters.size();

  std::vector<WordSearchHit> hits;
  for (Direction direction : AllDirections()) {
    if (std::find(directions.begin(), directions.end(), direction) == directions.end()) continue;
    for (const Slice& slice : GridSlices(direction, width, height)) {
      scan(letters, slice, hits);
    }
  }
  return hits;
}

//Every word starting at each offset of the slice; a run can end in
//several words
void WordSearchSolver::scan(const Grid& grid, const Slice& slice,
                            std::vector<WordSearchHit>& hits) const {
  for (size_t pos = 0; pos < slice.size(); ++pos) {
    const Coord& begin = slice[pos];
    const Trie* node = trie.getChild(grid[begin.second][begin.first]);
    std::string word(1, grid[begin.second][begin.first]);
    for (size_t end = pos + 1; end < slice.size() && node != nullptr; ++end) {
      const Coord& cell = slice[end];
      node = node->getChild(grid[cell.second][cell.first]);
      if (node == nullptr) break;
      word += grid[cell.second][cell.first];
      if (node->isWordEnd()) {
        WordSearchHit hit;
        hit.word = word;
        hit.start = begin;
        hit.end = cell;
        hits.push_back(hit);
      }
    }
  }
}
