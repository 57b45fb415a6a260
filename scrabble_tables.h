#pragma once
#include "grid.h"
#include <map>
#include <string>
#include <vector>

//Scrabble board is always square
static const int BOARD_SIZE = 15;

//Placing this many tiles in one move earns the bingo bonus
static const int BINGO_TILES = 7;
static const int BINGO_BONUS = 50;

//Rack placeholder for a blank tile
static const char BLANK_TILE = '#';

//Free square after board validation
static const char EMPTY_CELL = '*';

//Points per upper-case letter; anything missing is worth 0
typedef std::map<char, int> LetterValues;

//BOARD_SIZE rows of premium symbols:
//'*' none, 'd' double letter, 't' triple letter, 'D' double word, 'T' triple word
typedef std::vector<std::string> PremiumLayout;

const LetterValues& StandardLetterValues();

const PremiumLayout& StandardPremiumLayout();

//BOARD_SIZE x BOARD_SIZE board of free squares
Board EmptyStandardBoard();

int LetterMultiplier(char premium);

int WordMultiplier(char premium);
