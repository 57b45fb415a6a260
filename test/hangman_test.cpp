#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "hangman_solver.h"
#include "solver_errors.h"
#include "test_harness.h"

static const char* kAbWords =
    "ABOUT ABCEE ABLOW ABUZZ ABRIN ABORT ABORE ABUNE ABOHM ABLES ABERS ABHOR "
    "ABETS ABLER ABMHO ABOVE ABRIM ABYSS ABSEY ABIES ABYSM ABUTS ABIDE ABLED "
    "ABLET ABELE ABOIL ABOON ABRIS ABODE ABORD ABYES ABSIT ABUSE";

static std::vector<std::string> Words(const std::string& text) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

static std::vector<std::string> Dictionary() {
  std::vector<std::string> words = Words(kAbWords);
  std::vector<std::string> others = Words("ABACK ABBEY XBOUT BALLS CRANE AB ABOUTS ab-cd");
  words.insert(words.end(), others.begin(), others.end());
  return words;
}

static bool basic(std::string* why) {
  HangmanSolver solver(Dictionary());
  std::vector<std::string> ab = Words(kAbWords);
  std::set<std::string> expected(ab.begin(), ab.end());
  return CheckEqual(expected.size(), solver.solve("AB###", "").size(), "candidates", why) &&
         CheckTrue(solver.solve("AB###", "") == expected, "candidate set", why);
}

static bool distribution(std::string* why) {
  HangmanSolver solver(Dictionary());
  std::vector<LetterChance> chances = solver.guessDistribution("AB###", "");
  if (!CheckEqual((size_t)24, chances.size(), "letters offered", why)) return false;
  std::string order;
  for (size_t i = 0; i < 5; ++i) {
    order += chances[i].letter;
  }
  for (const LetterChance& chance : chances) {
    if (chance.letter == 'A' || chance.letter == 'B') {
      *why = std::string("known letter offered: ") + chance.letter;
      return false;
    }
  }
  return CheckEqual('E', chances[0].letter, "most likely letter", why) &&
         CheckEqual(0.5, chances[0].probability, "chance of E", why) &&
         CheckEqual(std::string("EOSRI"), order, "ranking", why);
}

static bool incorrectLetters(std::string* why) {
  HangmanSolver solver(Dictionary());
  std::set<std::string> found = solver.solve("AB###", "eo");
  for (const std::string& word : found) {
    if (word.find('E') != std::string::npos || word.find('O') != std::string::npos) {
      *why = word + " contains an incorrect letter";
      return false;
    }
  }
  std::set<std::string> expected = {"ABUZZ", "ABRIN", "ABRIM", "ABYSS", "ABYSM", "ABUTS", "ABRIS", "ABSIT"};
  if (!CheckTrue(found == expected, "candidates without E and O", why)) return false;

  std::vector<LetterChance> chances = solver.guessDistribution("AB###", "EO");
  for (const LetterChance& chance : chances) {
    if (chance.letter == 'E' || chance.letter == 'O') {
      *why = std::string("incorrect letter offered: ") + chance.letter;
      return false;
    }
  }
  return true;
}

static bool repeatedLetter(std::string* why) {
  HangmanSolver solver(Words("ANA AHA AAA ANN"));
  std::set<std::string> expected = {"AHA", "ANA"};
  return CheckTrue(solver.solve("A#A", "") == expected, "A#A", why) &&
         CheckTrue(solver.solve("a_a", "") == expected, "lower case pattern", why);
}

static bool knownLetterNotElsewhere(std::string* why) {
  HangmanSolver solver(Words("TOOT TOTS TOOK BOOT"));
  std::set<std::string> expected = {"TOOK"};
  return CheckTrue(solver.solve("T###", "") == expected, "T only at the start", why);
}

static bool tiesAlphabetical(std::string* why) {
  HangmanSolver solver(Words("CAT DOG"));
  std::vector<LetterChance> chances = solver.guessDistribution("###", "");
  std::string order;
  for (size_t i = 0; i < 6; ++i) {
    order += chances[i].letter;
  }
  return CheckEqual(std::string("ACDGOT"), order, "letters at one half", why) &&
         CheckEqual(0.5, chances[5].probability, "chance", why) &&
         CheckEqual(0.0, chances[6].probability, "chance of an absent letter", why);
}

static bool noCandidates(std::string* why) {
  HangmanSolver solver(Dictionary());
  return CheckTrue(solver.solve("ZZ###", "").empty(), "candidates for ZZ###", why) &&
         CheckTrue(solver.solve("#########", "").empty(), "candidates of unknown length", why) &&
         Throws<SolvingExecution>([&solver] { solver.guessDistribution("ZZ###", ""); },
                                  "distribution without candidates", why);
}

static bool invalidParameters(std::string* why) {
  HangmanSolver solver(Dictionary());
  return Throws<InvalidParameters>([&solver] { solver.solve("", ""); }, "empty attempt", why) &&
         Throws<InvalidParameters>([&solver] { solver.solve("AB###", "E1"); }, "digit incorrect", why) &&
         Throws<InvalidParameters>([&solver] { solver.guessDistribution("", "E"); }, "empty attempt", why);
}

int main() {
  TestRun run("hangman");
  run.run("basic", basic);
  run.run("distribution", distribution);
  run.run("incorrect letters", incorrectLetters);
  run.run("repeated letter", repeatedLetter);
  run.run("known letter not elsewhere", knownLetterNotElsewhere);
  run.run("ties alphabetical", tiesAlphabetical);
  run.run("no candidates", noCandidates);
  run.run("invalid parameters", invalidParameters);
  return run.finish();
}
