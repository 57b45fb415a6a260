#include "boggle_solver.h"
#include "solver_errors.h"
#include "word_list.h"
#include <algorithm>

namespace {

std::string ReplaceAll(std::string str, const std::string& from, const std::string& to) {
  if (from.empty()) return str;
  size_t at = 0;
  while ((at = str.find(from, at)) != std::string::npos) {
    str.replace(at, from.size(), to);
    at += to.size();
  }
  return str;
}

//Search state: trie node reached and the cells used to get there
struct Frame {
  const Trie* node;
  Path path;
};

std::string Spell(const Grid& grid, const Path& path) {
  std::string letters;
  for (const Coord& cell : path) {
    letters += grid[cell.first][cell.second];
  }
  return letters;
}

}  // namespace

const Substitutions& DefaultSubstitutions() {
  static const Substitutions defaults = {{"QU", "Q"}};
  return defaults;
}

BoggleSolver::BoggleSolver(const std::vector<std::string>& words, int min_length,
                           const Substitutions& substitutions)
  : min_length(min_length), substitutions(substitutions) {
  if (min_length < 0) {
    throw InvalidParameters("min_length", "Value needs to be non-negative.");
  }
  for (const auto& sub : substitutions) {
    if (sub.first.empty() || sub.second.size() != 1) {
      throw InvalidParameters("substitutions",
                              "Each entry must map a non-empty string to a single character.");
    }
  }
  for (const std::string& word : words) {
    if (!IsAlphaWord(word) || (int)word.size() < min_length) continue;
    trie.add(substitute(ToUpper(word)));
  }
}

std::vector<std::string> BoggleSolver::solve(const Board& board) const {
  std::vector<std::string> words;
  for (const BoggleWord& found : solveWithPaths(board)) {
    words.push_back(found.word);
  }
  return words;
}

std::vector<BoggleWord> BoggleSolver::solveWithPaths(const Board& board) const {
  Grid grid = NormalizeGrid(board, "board", [this](const std::string& cell) {
    return substitute(ToUpper(cell));
  });

  std::vector<BoggleWord> found;
  std::unordered_map<std::string, size_t> slots;
  const int width = GridWidth(grid);
  for (int row = 0; row < (int)grid.size(); ++row) {
    for (int col = 0; col < width; ++col) {
      search(grid, row, col, found, slots);
    }
  }

  std::stable_sort(found.begin(), found.end(), [](const BoggleWord& a, const BoggleWord& b) {
    return a.word.size() > b.word.size();
  });
  return found;
}

std::string BoggleSolver::substitute(std::string word) const {
  for (const auto& sub : substitutions) {
    word = ReplaceAll(word, sub.first, sub.second);
  }
  return word;
}

std::string BoggleSolver::restore(std::string word) const {
  for (const auto& sub : substitutions) {
    word = ReplaceAll(word, sub.second, sub.first);
  }
  return word;
}

//Depth-first walk from (row, col) with an explicit stack. A branch ends as
//soon as the trie has no child for the next cell.
void BoggleSolver::search(const Grid& grid, int row, int col, std::vector<BoggleWord>& found,
                          std::unordered_map<std::string, size_t>& slots) const {
  const int height = (int)grid.size();
  const int width = GridWidth(grid);

  auto record = [&](const Path& path) {
    const std::string word = restore(Spell(grid, path));
    std::unordered_map<std::string, size_t>::iterator slot = slots.find(word);
    if (slot == slots.end()) {
      slots[word] = found.size();
      BoggleWord entry;
      entry.word = word;
      entry.paths.push_back(path);
      found.push_back(entry);
    } else {
      found[slot->second].paths.push_back(path);
    }
  };

  const Trie* first = trie.getChild(grid[row][col]);
  if (first == nullptr) return;

  std::vector<Frame> stack;
  stack.push_back(Frame{first, Path(1, Coord(row, col))});
  if (first->isWordEnd()) record(stack.back().path);

  while (!stack.empty()) {
    Frame current = std::move(stack.back());
    stack.pop_back();

    const Coord last = current.path.back();
    for (int r = std::max(0, last.first - 1); r < std::min(height, last.first + 2); ++r) {
      for (int c = std::max(0, last.second - 1); c < std::min(width, last.second + 2); ++c) {
        const Coord next(r, c);
        if (std::find(current.path.begin(), current.path.end(), next) != current.path.end()) continue;

        const Trie* child = current.node->getChild(grid[r][c]);
        if (child == nullptr) continue;

        Path path = current.path;
        path.push_back(next);
        if (child->isWordEnd()) record(path);
        stack.push_back(Frame{child, path});
      }
    }
  }
}
