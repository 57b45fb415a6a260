#pragma once
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

typedef std::set<std::string> WordSet;

//A letter and the index it must sit at
typedef std::pair<char, int> Requirement;

//Reverse lookup of words by (length, letter, position). A word of length L
//is filed once under each of its own letters, so it can be reached from
//several keys. Words are also filed by length alone.
class PositionalIndex {
public:
  PositionalIndex();

  void add(const std::string& word);

  //Words of the given length with letter at position; empty for unknown keys
  const WordSet& lookup(int length, char letter, int position) const;

  //All words of the given length
  const WordSet& withLength(int length) const;

  //Words of the given length meeting every requirement. With no
  //requirements this is withLength(length).
  WordSet find(int length, const std::vector<Requirement>& requirements) const;

  void clear();
  size_t size() const { return num_words; }

private:
  static uint64_t key(int length, char letter, int position);

  std::unordered_map<uint64_t, WordSet> table;
  std::unordered_map<int, WordSet> by_length;
  size_t num_words;
};
