#ifndef _validators_sudoku_validator_h_included_
#define _validators_sudoku_validator_h_included_

#include <bitset>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>


namespace validators {


using num_t = uint8_t;

// One string per row, one char per cell.
using board_t = std::vector<std::string>;

constexpr char empty_cell = '-';

// '1'..'9' and 'A'..'Z'
constexpr num_t max_symbol_value = 10 + ('Z' - 'A');
constexpr size_t max_board_size = max_symbol_value;

using seen_t = std::bitset<max_symbol_value + 1>;


enum class sudoku_verdict_t {
	ok,
	empty_board,
	not_square,
	size_not_perfect_square,
	size_too_large,
	bad_symbol,
	value_out_of_range,
	duplicate_in_row,
	duplicate_in_column,
	duplicate_in_box,
};

const char* to_string(sudoku_verdict_t v);
std::ostream& operator<<(std::ostream& os, sudoku_verdict_t v);


bool symbol_is_empty(char c);

// Digits decode to their face value, 'A' is 10, 'B' is 11 and so on.
// No range check against a board size here.
std::optional<num_t> symbol_parse(char c);

std::optional<size_t> exact_sqrt(size_t n);

size_t box_index(size_t row, size_t col, size_t box_size);


// Rules are checked in order: shape, size, then a single row-major scan over the cells.
// The first violated rule is reported.
sudoku_verdict_t check_sudoku(const board_t& board);

bool is_valid_sudoku(const board_t& board);


} // namespace validators

#endif
