#include "validator.h"

#include <ostream>

#include <assert.h>


namespace validators {


const char* to_string(sudoku_verdict_t v)
{
	switch (v) {
		case sudoku_verdict_t::ok: return "ok";
		case sudoku_verdict_t::empty_board: return "empty_board";
		case sudoku_verdict_t::not_square: return "not_square";
		case sudoku_verdict_t::size_not_perfect_square: return "size_not_perfect_square";
		case sudoku_verdict_t::size_too_large: return "size_too_large";
		case sudoku_verdict_t::bad_symbol: return "bad_symbol";
		case sudoku_verdict_t::value_out_of_range: return "value_out_of_range";
		case sudoku_verdict_t::duplicate_in_row: return "duplicate_in_row";
		case sudoku_verdict_t::duplicate_in_column: return "duplicate_in_column";
		case sudoku_verdict_t::duplicate_in_box: return "duplicate_in_box";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, sudoku_verdict_t v)
{
	return os << to_string(v);
}


bool symbol_is_empty(char c)
{
	return c == empty_cell;
}


std::optional<num_t> symbol_parse(char c)
{
	if (c >= '0' && c <= '9')
		return static_cast<num_t>(c - '0');
	if (c >= 'A' && c <= 'Z')
		return static_cast<num_t>(10 + (c - 'A'));
	return std::nullopt;
}


std::optional<size_t> exact_sqrt(size_t n)
{
	size_t k = 0;
	while ((k + 1) * (k + 1) <= n) {
		++k;
	}
	if (k * k != n) {
		return std::nullopt;
	}
	return k;
}


size_t box_index(size_t row, size_t col, size_t box_size)
{
	assert(box_size > 0);
	return (row / box_size) * box_size + (col / box_size);
}


namespace {

// seen-value sets of one kind (rows, columns or boxes)
using seen_family_t = std::vector<seen_t>;

} // namespace


sudoku_verdict_t check_sudoku(const board_t& board)
{
	size_t const n = board.size();
	if (n == 0) {
		return sudoku_verdict_t::empty_board;
	}
	for (const auto& row : board) {
		if (row.size() != n) {
			return sudoku_verdict_t::not_square;
		}
	}
	auto const k = exact_sqrt(n);
	if (!k) {
		return sudoku_verdict_t::size_not_perfect_square;
	}
	if (n > max_board_size) {
		return sudoku_verdict_t::size_too_large;
	}
	size_t const box_size = k.value();

	seen_family_t rows(n);
	seen_family_t cols(n);
	seen_family_t boxes(n);

	for (size_t r = 0; r < n; ++r) {
		for (size_t c = 0; c < n; ++c) {
			char const symbol = board.at(r).at(c);
			if (symbol_is_empty(symbol)) {
				continue;
			}

			auto const value = symbol_parse(symbol);
			if (!value) {
				return sudoku_verdict_t::bad_symbol;
			}
			num_t const v = value.value();
			if (v < 1 || static_cast<size_t>(v) > n) {
				return sudoku_verdict_t::value_out_of_range;
			}

			auto& box = boxes.at(box_index(r, c, box_size));
			if (rows.at(r).test(v)) {
				return sudoku_verdict_t::duplicate_in_row;
			}
			if (cols.at(c).test(v)) {
				return sudoku_verdict_t::duplicate_in_column;
			}
			if (box.test(v)) {
				return sudoku_verdict_t::duplicate_in_box;
			}

			rows.at(r).set(v);
			cols.at(c).set(v);
			box.set(v);
		}
	}

	return sudoku_verdict_t::ok;
}


bool is_valid_sudoku(const board_t& board)
{
	return check_sudoku(board) == sudoku_verdict_t::ok;
}


} // namespace validators
