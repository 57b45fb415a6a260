#pragma once
#include <map>
#include <string>

//Prefix tree of words. Every node owns its children outright, so dropping
//a node drops the whole subtree below it.
class Trie {
public:
  typedef std::map<char, Trie*> Children;

  //Walks the direct children of a node in letter order
  class Iter {
  public:
    explicit Iter(const Children& children);
    bool next();
    Trie* get() const;
    char getLetter() const;

  private:
    Children::const_iterator cur;
    Children::const_iterator end;
    bool started;
  };

  Trie();
  ~Trie();
  Trie(const Trie&) = delete;
  Trie& operator=(const Trie&) = delete;

  void add(const std::string& str);
  bool has(const std::string& str) const;
  bool hasPrefix(const std::string& str) const;

  //Child reached by letter c, or nullptr
  const Trie* getChild(char c) const;
  bool isWordEnd() const { return is_word_end; }
  bool empty() const { return nodes.empty(); }

  //Discards every subtree below this node
  void clear();

  Iter iter() const { return Iter(nodes); }

private:
  const Trie* walk(const std::string& str) const;

  Children nodes;
  bool is_word_end;
};
