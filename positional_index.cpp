#include "positional_index.h"
#include <algorithm>

namespace {
const WordSet g_no_words;
}

PositionalIndex::PositionalIndex() : num_words(0) {}

void PositionalIndex::add(const std::string& word) {
  if (word.empty()) return;
  const int length = (int)word.size();
  if (!by_length[length].insert(word).second) return;
  num_words += 1;
  for (int position = 0; position < length; ++position) {
    table[key(length, word[position], position)].insert(word);
  }
}

const WordSet& PositionalIndex::lookup(int length, char letter, int position) const {
  std::unordered_map<uint64_t, WordSet>::const_iterator it = table.find(key(length, letter, position));
  if (it == table.end()) return g_no_words;
  return it->second;
}

const WordSet& PositionalIndex::withLength(int length) const {
  std::unordered_map<int, WordSet>::const_iterator it = by_length.find(length);
  if (it == by_length.end()) return g_no_words;
  return it->second;
}

WordSet PositionalIndex::find(int length, const std::vector<Requirement>& requirements) const {
  if (requirements.empty()) return withLength(length);

  std::vector<const WordSet*> sets;
  for (const Requirement& req : requirements) {
    const WordSet& matches = lookup(length, req.first, req.second);
    if (matches.empty()) return WordSet();
    sets.push_back(&matches);
  }
  //Walk the smallest set and probe the others
  std::sort(sets.begin(), sets.end(), [](const WordSet* a, const WordSet* b) {
    return a->size() < b->size();
  });

  WordSet result;
  for (const std::string& word : *sets[0]) {
    bool in_all = true;
    for (size_t i = 1; i < sets.size() && in_all; ++i) {
      in_all = sets[i]->count(word) != 0;
    }
    if (in_all) result.insert(result.end(), word);
  }
  return result;
}

void PositionalIndex::clear() {
  table.clear();
  by_length.clear();
  num_words = 0;
}

uint64_t PositionalIndex::key(int length, char letter, int position) {
  return ((uint64_t)(uint32_t)length << 32) |
         ((uint64_t)(unsigned char)letter << 24) |
         ((uint64_t)(uint32_t)position & 0xFFFFFFu);
}
