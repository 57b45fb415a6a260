#include "trie.h"

Trie::Iter::Iter(const Children& children)
  : cur(children.begin()), end(children.end()), started(false) {}

bool Trie::Iter::next() {
  if (!started) {
    started = true;
  } else if (cur != end) {
    ++cur;
  }
  return cur != end;
}

Trie* Trie::Iter::get() const {
  return cur->second;
}

char Trie::Iter::getLetter() const {
  return cur->first;
}

Trie::Trie() : is_word_end(false) {}

Trie::~Trie() {
  clear();
}

void Trie::add(const std::string& str) {
  if (str.empty()) return;

  Trie* ptr = this;
  for (char c : str) {
    Trie*& child = ptr->nodes[c];
    if (child == nullptr) {
      child = new Trie();
    }
    ptr = child;
  }
  ptr->is_word_end = true;
}

bool Trie::has(const std::string& str) const {
  if (str.empty()) return false;
  const Trie* node = walk(str);
  return node != nullptr && node->is_word_end;
}

bool Trie::hasPrefix(const std::string& str) const {
  //Any node on the path counts, word end or not
  return walk(str) != nullptr;
}

const Trie* Trie::getChild(char c) const {
  Children::const_iterator it = nodes.find(c);
  if (it == nodes.end()) return nullptr;
  return it->second;
}

void Trie::clear() {
  Iter i = iter();
  while (i.next()) { delete i.get(); }
  nodes.clear();
  is_word_end = false;
}

const Trie* Trie::walk(const std::string& str) const {
  const Trie* ptr = this;
  for (char c : str) {
    ptr = ptr->getChild(c);
    if (ptr == nullptr) return nullptr;
  }
  return ptr;
}
