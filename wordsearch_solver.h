#pragma once
#include "grid.h"
#include "trie.h"
#include <string>
#include <vector>

enum class Direction {
  North,
  NorthEast,
  East,
  SouthEast,
  South,
  SouthWest,
  West,
  NorthWest
};

//N, NE, E, SE, S, SW, W, NW in that order
const std::vector<Direction>& AllDirections();

//Compass abbreviation (case-insensitive) to Direction. Throws
//InvalidParameters for anything else, including "ALL".
Direction ParseDirection(const std::string& name);

const char* DirectionName(Direction direction);

//Straight run of grid cells as (x, y), in scan order
typedef std::vector<Coord> Slice;

//Every maximal slice of a width x height grid read in the given direction
std::vector<Slice> GridSlices(Direction direction, int width, int height);

struct WordSearchHit {
  std::string word;
  Coord start;  // (x, y) of the first letter
  Coord end;    // (x, y) of the last letter

  bool operator==(const WordSearchHit& other) const {
    return word == other.word && start == other.start && end == other.end;
  }
};

class WordSearchSolver {
public:
  explicit WordSearchSolver(const std::vector<std::string>& words);

  //Searches all eight directions
  std::vector<WordSearchHit> solve(const Board& grid) const;

  //Directions by compass name; "ALL" selects every direction and an empty
  //list means all of them
  std::vector<WordSearchHit> solve(const Board& grid, const std::vector<std::string>& directions) const;

  std::vector<WordSearchHit> solve(const Board& grid, const std::vector<Direction>& directions) const;

private:
  void scan(const Grid& grid, const Slice& slice, std::vector<WordSearchHit>& hits) const;

  Trie trie;
};
