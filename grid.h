#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

//Caller-facing board: rows of cell strings
typedef std::vector<std::vector<std::string> > Board;

//Validated board: one character per cell, all rows the same width
typedef std::vector<std::string> Grid;

typedef std::pair<int, int> Coord;

typedef std::function<std::string(const std::string&)> CellNormalizer;

//Checks board is rectangular, runs normalize on every cell and requires
//the result to be a single character. Throws InvalidParameters naming
//parameter on failure. The caller's board is left untouched.
Grid NormalizeGrid(const Board& board, const std::string& parameter,
                   const CellNormalizer& normalize);

Grid Transpose(const Grid& grid);

int GridWidth(const Grid& grid);
