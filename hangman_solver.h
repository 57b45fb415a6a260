#pragma once
#include "positional_index.h"
#include <set>
#include <string>
#include <vector>

struct LetterChance {
  char letter;
  double probability;
};

//Narrows a Hangman game down to the dictionary words still possible and
//ranks the letters worth guessing next.
//
//An attempt is the pattern so far: letters where they are known, anything
//else (e.g. '#', '_') where they are not.
class HangmanSolver {
public:
  explicit HangmanSolver(const std::vector<std::string>& words);

  //Every word that fits attempt and contains none of the incorrect letters
  std::set<std::string> solve(const std::string& attempt, const std::string& incorrect) const;

  //For each letter not yet guessed, the fraction of remaining candidates
  //containing it. Most likely first, ties alphabetical. Throws
  //SolvingExecution when no candidate is left.
  std::vector<LetterChance> guessDistribution(const std::string& attempt,
                                              const std::string& incorrect) const;

private:
  std::set<std::string> candidates(const std::string& attempt, const std::string& incorrect) const;

  static std::string validateAttempt(const std::string& attempt);
  static std::string validateIncorrect(const std::string& incorrect);

  PositionalIndex index;
};
