#include "scrabble_solver.h"
#include "solver_errors.h"
#include "word_list.h"
#include <algorithm>
#include <set>

namespace {

bool IsLetter(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

char Upper(char c) {
  return (c >= 'a' && c <= 'z') ? (char)(c - 'a' + 'A') : c;
}

char Lower(char c) {
  return (c >= 'A' && c <= 'Z') ? (char)(c - 'A' + 'a') : c;
}

bool IsPremiumSymbol(char c) {
  return c == EMPTY_CELL || c == 'd' || c == 't' || c == 'D' || c == 'T';
}

}  // namespace

ScrabbleSolver::ScrabbleSolver(const std::vector<std::string>& words,
                               const LetterValues& values, const PremiumLayout& premium)
  : values(values), premium(premium) {
  if ((int)premium.size() != BOARD_SIZE) {
    throw InvalidParameters("premium", "Expected " + std::to_string(BOARD_SIZE) + " rows, received " +
                            std::to_string(premium.size()) + ".");
  }
  for (const std::string& row : premium) {
    if ((int)row.size() != BOARD_SIZE || !std::all_of(row.begin(), row.end(), IsPremiumSymbol)) {
      throw InvalidParameters("premium", "Rows must be " + std::to_string(BOARD_SIZE) +
                              " symbols from '*', 'd', 't', 'D', 'T'.");
    }
  }
  for (const auto& entry : values) {
    if (entry.first < 'A' || entry.first > 'Z') {
      throw InvalidParameters("values", std::string("Key '") + entry.first + "' is not an upper-case letter.");
    }
  }
  premium_transposed = Transpose(premium);

  for (const std::string& word : words) {
    if (!IsAlphaWord(word)) continue;
    index.add(ToUpper(word));
  }
}

std::vector<ScrabbleSolution> ScrabbleSolver::solve(const Board& board, const Rack& rack) const {
  const Grid grid = validateBoard(board);
  const std::string tiles = validateRack(rack);

  //Equivalent derivations of the same play collapse here
  std::set<ScrabbleSolution> found;
  std::vector<Candidate> candidates;

  horizontalSolve(prepare(grid, premium, tiles), candidates);
  for (const Candidate& c : candidates) {
    found.insert(ScrabbleSolution{c.word, c.x, c.y, false, c.score});
  }

  candidates.clear();
  horizontalSolve(prepare(Transpose(grid), premium_transposed, tiles), candidates);
  for (const Candidate& c : candidates) {
    found.insert(ScrabbleSolution{c.word, c.y, c.x, true, c.score});
  }

  std::vector<ScrabbleSolution> solutions(found.begin(), found.end());
  std::stable_sort(solutions.begin(), solutions.end(),
                   [](const ScrabbleSolution& a, const ScrabbleSolution& b) {
    return a.score > b.score;
  });
  return solutions;
}

int ScrabbleSolver::getScore(const Board& board, const Rack& rack, const Placement& attempt) const {
  const Grid grid = validateBoard(board);
  const std::string tiles = validateRack(rack);
  validatePlacement(attempt);

  int x = attempt.x;
  int y = attempt.y;
  Axis axis;
  if (attempt.vertical) {
    axis = prepare(Transpose(grid), premium_transposed, tiles);
    std::swap(x, y);
  } else {
    axis = prepare(grid, premium, tiles);
  }

  std::string word = attempt.word;
  //The word must not run on into a tile on either side
  if (IsLetter(axis.tile(x - 1, y)) || IsLetter(axis.tile(x + (int)word.size(), y))) return -1;

  std::vector<int> placements;
  bool adjacent = false;
  for (int n = 0; n < (int)word.size(); ++n) {
    const char tile = axis.tile(x + n, y);
    if (tile == '\0') return -1;
    if (IsLetter(tile)) {
      if (Upper(tile) != Upper(word[n])) return -1;
      word[n] = Upper(tile);
      adjacent = true;
      continue;
    }
    if (placements.size() == tiles.size()) return -1;
    placements.push_back(n);
    if (!adjacent) {
      adjacent = isVerticallyAdjacent(axis, x + n, y);
    }
  }
  if (!adjacent) return -1;

  WordSet single;
  single.insert(word);
  std::vector<Candidate> found;
  yieldSolutions(axis, single, x, y, placements, found);
  if (found.empty()) return -1;
  return found.front().score;
}

char ScrabbleSolver::Axis::tile(int x, int y) const {
  if (y < 0 || y >= (int)board.size() || x < 0 || x >= (int)board[y].size()) return '\0';
  return board[y][x];
}

ScrabbleSolver::Axis ScrabbleSolver::prepare(const Grid& board, const PremiumLayout& layout,
                                             const std::string& rack) const {
  Axis axis;
  axis.board = board;
  axis.premium = layout;
  axis.rack = rack;
  minorScores(axis);
  return axis;
}

//Scores of the vertical word formed through each free square, per letter
//that could go there. A square with no vertical neighbours takes any letter
//for 0; one whose run has no dictionary completion takes none.
void ScrabbleSolver::minorScores(Axis& axis) const {
  MinorCell allow_all;
  for (char c = 'A'; c <= 'Z'; ++c) {
    allow_all[c] = 0;
    allow_all[Lower(c)] = 0;
  }

  const int height = (int)axis.board.size();
  const int width = GridWidth(axis.board);
  axis.minor.assign(height, std::vector<MinorCell>(width));

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      if (axis.tile(x, y) != EMPTY_CELL) continue;

      std::string above;
      for (int up = y - 1; IsLetter(axis.tile(x, up)); --up) {
        above.insert(above.begin(), Upper(axis.tile(x, up)));
      }
      std::string below;
      for (int down = y + 1; IsLetter(axis.tile(x, down)); ++down) {
        below += Upper(axis.tile(x, down));
      }
      if (above.empty() && below.empty()) {
        axis.minor[y][x] = allow_all;
        continue;
      }

      const std::string letters = above + EMPTY_CELL + below;
      const int ind = (int)above.size();
      std::vector<Requirement> requirements;
      int base_value = 0;
      for (int pos = 0; pos < (int)letters.size(); ++pos) {
        if (pos == ind) continue;
        requirements.push_back(Requirement(letters[pos], pos));
        base_value += value(letters[pos]);
      }
      const int letter_mult = LetterMultiplier(axis.premium[y][x]);
      const int word_mult = WordMultiplier(axis.premium[y][x]);

      MinorCell& cell = axis.minor[y][x];
      for (const std::string& word : index.find((int)letters.size(), requirements)) {
        const char letter = word[ind];
        cell[letter] = word_mult * (base_value + letter_mult * value(letter));
        cell[Lower(letter)] = word_mult * base_value;
      }
    }
  }
}

void ScrabbleSolver::horizontalSolve(const Axis& axis, std::vector<Candidate>& out) const {
  for (int y = 0; y < (int)axis.board.size(); ++y) {
    for (int x = 0; x < GridWidth(axis.board); ++x) {
      horizontalSolutions(axis, x, y, out);
    }
  }
}

//Streams squares rightwards from (x, y). Board letters become requirements
//and free squares become placement slots; each time the stream reaches a
//free square or the edge, words of the length covered so far are tried.
void ScrabbleSolver::horizontalSolutions(const Axis& axis, int x, int y,
                                         std::vector<Candidate>& out) const {
  // Not interested in positions with a preceding tile to the left
  if (IsLetter(axis.tile(x - 1, y))) return;

  std::vector<int> placements;
  std::vector<Requirement> requirements;
  bool adjacent = false;

  for (int n = 0; ; ++n) {
    const char tile = axis.tile(x + n, y);
    if (IsLetter(tile)) {
      requirements.push_back(Requirement(Upper(tile), n));
    } else if (!requirements.empty() || adjacent) {
      if (requirements.empty()) {
        yieldSolutions(axis, index.withLength(n), x, y, placements, out);
      } else {
        yieldSolutions(axis, index.find(n, requirements), x, y, placements, out);
      }
    }

    if (tile == '\0') break;
    if (tile == EMPTY_CELL) {
      if (placements.size() == axis.rack.size()) break;
      placements.push_back(n);
      if (!adjacent) {
        adjacent = isVerticallyAdjacent(axis, x + n, y);
      }
    }
  }
}

void ScrabbleSolver::yieldSolutions(const Axis& axis, const WordSet& words, int x, int y,
                                    const std::vector<int>& placements,
                                    std::vector<Candidate>& out) const {
  for (const std::string& word : words) {
    const std::string tiles = rackTiles(axis.rack, word, placements);
    if (tiles.empty()) continue;

    std::string played = word;
    int score = 0;
    bool legal = true;
    for (size_t i = 0; i < placements.size(); ++i) {
      const char letter = tiles[i];
      const int pos = placements[i];
      const MinorCell& cell = axis.minor[y][x + pos];
      MinorCell::const_iterator cross = cell.find(letter);
      if (cross == cell.end()) {
        legal = false;
        break;
      }
      played[pos] = letter;
      score += cross->second;
    }
    if (!legal) continue;

    const bool bingo = (int)placements.size() == BINGO_TILES;
    score += majorScore(axis, played, x, y, bingo);
    out.push_back(Candidate{played, x, y, score});
  }
}

//Letter and word multipliers only count on squares covered by this play;
//blanks (lower case) are worth nothing
int ScrabbleSolver::majorScore(const Axis& axis, const std::string& word, int x, int y,
                               bool bingo) const {
  int value_total = 0;
  int word_mult = 1;
  for (int n = 0; n < (int)word.size(); ++n) {
    int letter_mult = 1;
    if (axis.tile(x + n, y) == EMPTY_CELL) {
      letter_mult = LetterMultiplier(axis.premium[y][x + n]);
      word_mult *= WordMultiplier(axis.premium[y][x + n]);
    }
    value_total += value(word[n]) * letter_mult;
  }
  return value_total * word_mult + (bingo ? BINGO_BONUS : 0);
}

//On the centre square, or touching a tile above or below
bool ScrabbleSolver::isVerticallyAdjacent(const Axis& axis, int x, int y) const {
  const int height = (int)axis.board.size();
  const int width = GridWidth(axis.board);
  if (2 * x == width - 1 && 2 * y == height - 1) return true;
  return IsLetter(axis.tile(x, y - 1)) || IsLetter(axis.tile(x, y + 1));
}

int ScrabbleSolver::value(char letter) const {
  LetterValues::const_iterator it = values.find(letter);
  return it == values.end() ? 0 : it->second;
}

//Rack tiles used to lay word's letters at placements, in placement order.
//An exact tile is used before a blank; a blank comes back lower case.
//Empty when the rack cannot supply them.
std::string ScrabbleSolver::rackTiles(std::string rack, const std::string& word,
                                      const std::vector<int>& placements) {
  std::string tiles;
  for (int pos : placements) {
    const char letter = word[pos];
    size_t at = rack.find(letter);
    if (at != std::string::npos) {
      rack.erase(at, 1);
      tiles += letter;
    } else if ((at = rack.find(BLANK_TILE)) != std::string::npos) {
      rack.erase(at, 1);
      tiles += Lower(letter);
    } else {
      return "";
    }
  }
  return tiles;
}

Grid ScrabbleSolver::validateBoard(const Board& board) {
  if ((int)board.size() != BOARD_SIZE) {
    throw InvalidParameters("board", "Expected " + std::to_string(BOARD_SIZE) + " rows, received " +
                            std::to_string(board.size()) + ".");
  }
  for (const auto& row : board) {
    if ((int)row.size() != BOARD_SIZE) {
      throw InvalidParameters("board", "Not all rows are " + std::to_string(BOARD_SIZE) +
                              " tiles long.");
    }
  }
  return NormalizeGrid(board, "board", [](const std::string& cell) {
    return IsAlphaWord(cell) ? cell : std::string(1, EMPTY_CELL);
  });
}

std::string ScrabbleSolver::validateRack(const Rack& rack) {
  std::string tiles;
  for (size_t i = 0; i < rack.size(); ++i) {
    const std::string& tile = rack[i];
    if (tile.size() != 1 || !(IsLetter(tile[0]) || tile[0] == BLANK_TILE)) {
      throw InvalidParameters("rack", "Tile " + std::to_string(i) + " ('" + tile +
                              "') is not a letter or '" + BLANK_TILE + "'.");
    }
    tiles += Upper(tile[0]);
  }
  return tiles;
}

void ScrabbleSolver::validatePlacement(const Placement& attempt) {
  if (!IsAlphaWord(attempt.word)) {
    throw InvalidParameters("attempt", "The word value is not an alphabetical string.");
  }
}
