#include "word_list.h"
#include "solver_errors.h"
#include <fstream>
#include <iostream>

namespace {

bool IsWordChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '\'';
}

void AppendTokens(const std::string& line, std::vector<std::string>& out) {
  std::string token;
  for (char c : line) {
    if (IsWordChar(c)) {
      token += (c >= 'a' && c <= 'z') ? (char)(c - 'a' + 'A') : c;
    } else if (!token.empty()) {
      out.push_back(token);
      token.clear();
    }
  }
  if (!token.empty()) {
    out.push_back(token);
  }
}

}  // namespace

std::string ToUpper(std::string str) {
  for (auto& c : str) {
    if (c >= 'a' && c <= 'z') c = c - 'a' + 'A';
  }
  return str;
}

bool IsAlphaWord(const std::string& str) {
  if (str.empty()) return false;
  for (char c : str) {
    if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'))) return false;
  }
  return true;
}

std::vector<std::string> TokenizeWords(const std::string& text) {
  std::vector<std::string> words;
  AppendTokens(text, words);
  return words;
}

//Word list may hold one word per line or running text
std::vector<std::string> LoadWordFile(const std::string& fname) {
  std::cout << "Loading word list " << fname << "..." << std::endl;
  std::ifstream fin(fname);
  if (!fin) {
    std::cerr << "Error: Cannot open word list " << fname << std::endl;
    throw ExternalResource("cannot open word list '" + fname + "'");
  }
  std::vector<std::string> words;
  std::string line;
  while (std::getline(fin, line)) {
    // Remove carriage return if present
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    AppendTokens(line, words);
  }
  std::cout << "Loaded " << words.size() << " words." << std::endl;
  return words;
}
