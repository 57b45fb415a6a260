#pragma once
#include <string>
#include <vector>

std::string ToUpper(std::string str);

//True for a non-empty string of letters A-Z/a-z only
bool IsAlphaWord(const std::string& str);

//Splits text into maximal runs of letters, digits, '_' and apostrophes,
//upper-cased
std::vector<std::string> TokenizeWords(const std::string& text);

//Reads every token of a word list file. Throws ExternalResource when the
//file cannot be opened.
std::vector<std::string> LoadWordFile(const std::string& fname);
