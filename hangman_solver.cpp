#include "hangman_solver.h"
#include "solver_errors.h"
#include "word_list.h"
#include <algorithm>

namespace {

bool IsUpper(char c) {
  return c >= 'A' && c <= 'Z';
}

void Exclude(std::set<std::string>& words, const WordSet& matches) {
  for (const std::string& word : matches) {
    words.erase(word);
  }
}

}  // namespace

HangmanSolver::HangmanSolver(const std::vector<std::string>& words) {
  for (const std::string& word : words) {
    if (!IsAlphaWord(word)) continue;
    index.add(ToUpper(word));
  }
}

std::set<std::string> HangmanSolver::solve(const std::string& attempt,
                                           const std::string& incorrect) const {
  return candidates(validateAttempt(attempt), validateIncorrect(incorrect));
}

std::vector<LetterChance> HangmanSolver::guessDistribution(const std::string& attempt,
                                                           const std::string& incorrect) const {
  const std::string pattern = validateAttempt(attempt);
  const std::string wrong = validateIncorrect(incorrect);
  const std::set<std::string> words = candidates(pattern, wrong);
  if (words.empty()) {
    throw SolvingExecution("No dictionary word matches '" + attempt +
                           "', letter chances are undefined.");
  }

  std::vector<LetterChance> chances;
  for (char letter = 'A'; letter <= 'Z'; ++letter) {
    if (pattern.find(letter) != std::string::npos) continue;
    if (wrong.find(letter) != std::string::npos) continue;
    int count = 0;
    for (const std::string& word : words) {
      if (word.find(letter) != std::string::npos) ++count;
    }
    chances.push_back(LetterChance{letter, (double)count / words.size()});
  }
  std::stable_sort(chances.begin(), chances.end(), [](const LetterChance& a, const LetterChance& b) {
    return a.probability > b.probability;
  });
  return chances;
}

//Words of the attempt's length holding every known letter where it is
//known and nowhere else, and no incorrect letter at all
std::set<std::string> HangmanSolver::candidates(const std::string& attempt,
                                                const std::string& incorrect) const {
  const int length = (int)attempt.size();

  std::vector<Requirement> known;
  for (int pos = 0; pos < length; ++pos) {
    if (IsUpper(attempt[pos])) known.push_back(Requirement(attempt[pos], pos));
  }
  std::set<std::string> words = index.find(length, known);

  for (int pos = 0; pos < length; ++pos) {
    for (int other = 0; other < length; ++other) {
      if (!IsUpper(attempt[other])) continue;
      if (attempt[pos] == attempt[other]) continue;
      Exclude(words, index.lookup(length, attempt[other], pos));
    }
    for (char letter : incorrect) {
      Exclude(words, index.lookup(length, letter, pos));
    }
  }
  return words;
}

std::string HangmanSolver::validateAttempt(const std::string& attempt) {
  if (attempt.empty()) {
    throw InvalidParameters("attempt", "Expected at least one character.");
  }
  return ToUpper(attempt);
}

std::string HangmanSolver::validateIncorrect(const std::string& incorrect) {
  for (size_t i = 0; i < incorrect.size(); ++i) {
    if (!IsAlphaWord(std::string(1, incorrect[i]))) {
      throw InvalidParameters("incorrect", "Character " + std::to_string(i) + " ('" +
                              std::string(1, incorrect[i]) + "') is not a letter.");
    }
  }
  return ToUpper(incorrect);
}
