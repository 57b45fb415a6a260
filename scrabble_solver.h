#pragma once
#include "grid.h"
#include "positional_index.h"
#include "scrabble_tables.h"
#include <string>
#include <tuple>
#include <vector>

//Tiles on the rack: single letters, or BLANK_TILE
typedef std::vector<std::string> Rack;

//A word laid on the board. x is the column and y the row of its first
//letter. Lower-case letters in word are played blanks.
struct Placement {
  std::string word;
  int x;
  int y;
  bool vertical;
};

struct ScrabbleSolution {
  std::string word;
  int x;
  int y;
  bool vertical;
  int score;

  bool operator<(const ScrabbleSolution& other) const {
    return std::tie(word, x, y, vertical, score) <
           std::tie(other.word, other.x, other.y, other.vertical, other.score);
  }
  bool operator==(const ScrabbleSolution& other) const {
    return std::tie(word, x, y, vertical, score) ==
           std::tie(other.word, other.x, other.y, other.vertical, other.score);
  }
};

//Finds and scores every legal play of a rack on a Scrabble board.
//
//Board cells hold an upper-case letter for a tile, a lower-case letter for
//a played blank, and anything non-alphabetic ("", "*", ".") for a free
//square. Vertical plays are found by running the horizontal search on the
//transposed board.
class ScrabbleSolver {
public:
  explicit ScrabbleSolver(const std::vector<std::string>& words,
                          const LetterValues& values = StandardLetterValues(),
                          const PremiumLayout& premium = StandardPremiumLayout());

  //All plays, highest score first. Blanks are only used for letters the
  //rack does not hold.
  std::vector<ScrabbleSolution> solve(const Board& board, const Rack& rack) const;

  //Score of one fixed play, or -1 if it cannot legally be made
  int getScore(const Board& board, const Rack& rack, const Placement& attempt) const;

private:
  //Per-letter cross-word scores for one free square
  typedef std::map<char, int> MinorCell;

  //One axis of a solve: the board as seen horizontally, its premium layout,
  //the rack, and the cross-word scores of every free square
  struct Axis {
    Grid board;
    PremiumLayout premium;
    std::string rack;
    std::vector<std::vector<MinorCell> > minor;

    //Tile at (x, y): a letter, EMPTY_CELL, or '\0' off the board
    char tile(int x, int y) const;
  };

  //A horizontal play found on one axis
  struct Candidate {
    std::string word;
    int x;
    int y;
    int score;
  };

  Axis prepare(const Grid& board, const PremiumLayout& premium, const std::string& rack) const;
  void minorScores(Axis& axis) const;
  void horizontalSolve(const Axis& axis, std::vector<Candidate>& out) const;
  void horizontalSolutions(const Axis& axis, int x, int y, std::vector<Candidate>& out) const;
  void yieldSolutions(const Axis& axis, const WordSet& words, int x, int y,
                      const std::vector<int>& placements, std::vector<Candidate>& out) const;
  int majorScore(const Axis& axis, const std::string& word, int x, int y, bool bingo) const;
  bool isVerticallyAdjacent(const Axis& axis, int x, int y) const;
  int value(char letter) const;

  static std::string rackTiles(std::string rack, const std::string& word,
                               const std::vector<int>& placements);
  static Grid validateBoard(const Board& board);
  static std::string validateRack(const Rack& rack);
  static void validatePlacement(const Placement& attempt);

  PositionalIndex index;
  LetterValues values;
  PremiumLayout premium;
  PremiumLayout premium_transposed;
};
