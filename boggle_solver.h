#pragma once
#include "grid.h"
#include "trie.h"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

//Multi-letter sequences stored as a single board character, e.g. QU -> Q.
//Applied in order; all right-hand sides must be one character.
typedef std::vector<std::pair<std::string, std::string> > Substitutions;

const Substitutions& DefaultSubstitutions();

//Board cells as (row, column), first letter first
typedef std::vector<Coord> Path;

struct BoggleWord {
  std::string word;
  std::vector<Path> paths;
};

//Finds every dictionary word that can be traced on a Boggle board through
//adjacent cells (including diagonals) without reusing a cell.
class BoggleSolver {
public:
  explicit BoggleSolver(const std::vector<std::string>& words, int min_length = 3,
                        const Substitutions& substitutions = DefaultSubstitutions());

  //Words on the board, longest first; equal lengths keep discovery order
  std::vector<std::string> solve(const Board& board) const;

  //Same order as solve(), each word with every distinct path spelling it
  std::vector<BoggleWord> solveWithPaths(const Board& board) const;

  int minLength() const { return min_length; }

private:
  std::string substitute(std::string word) const;
  std::string restore(std::string word) const;
  void search(const Grid& grid, int row, int col, std::vector<BoggleWord>& found,
              std::unordered_map<std::string, size_t>& slots) const;

  Trie trie;
  int min_length;
  Substitutions substitutions;
};
