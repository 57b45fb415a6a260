#include "scrabble_tables.h"

const LetterValues& StandardLetterValues() {
  static const LetterValues values = {
    {'A', 1}, {'B', 3}, {'C', 3}, {'D', 2}, {'E', 1}, {'F', 4}, {'G', 2},
    {'H', 4}, {'I', 1}, {'J', 8}, {'K', 5}, {'L', 1}, {'M', 3}, {'N', 1},
    {'O', 1}, {'P', 3}, {'Q', 10}, {'R', 1}, {'S', 1}, {'T', 1}, {'U', 1},
    {'V', 4}, {'W', 4}, {'X', 8}, {'Y', 4}, {'Z', 10}
  };
  return values;
}

const PremiumLayout& StandardPremiumLayout() {
  static const PremiumLayout layout = {
    "T**d***T***d**T",
    "*D***t***t***D*",
    "**D***d*d***D**",
    "d**D***d***D**d",
    "****D*****D****",
    "*t***t***t***t*",
    "**d***d*d***d**",
    "T**d***D***d**T",
    "**d***d*d***d**",
    "*t***t***t***t*",
    "****D*****D****",
    "d**D***d***D**d",
    "**D***d*d***D**",
    "*D***t***t***D*",
    "T**d***T***d**T"
  };
  return layout;
}

Board EmptyStandardBoard() {
  return Board(BOARD_SIZE, std::vector<std::string>(BOARD_SIZE, std::string(1, EMPTY_CELL)));
}

int LetterMultiplier(char premium) {
  switch (premium) {
    case 'd': return 2;
    case 't': return 3;
    default: return 1;
  }
}

int WordMultiplier(char premium) {
  switch (premium) {
    case 'D': return 2;
    case 'T': return 3;
    default: return 1;
  }
}
