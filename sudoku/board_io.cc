#include "board_io.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/algorithm/string.hpp>


namespace validators {


board_t board_read(std::istream& is)
{
	board_t board;
	std::string line;
	while (std::getline(is, line)) {
		boost::algorithm::trim(line);
		if (line.empty())
			continue;
		board.emplace_back(std::move(line));
	}
	if (is.bad())
		throw std::runtime_error("board read error");
	return board;
}


void board_print(std::ostream& os, const board_t& board)
{
	size_t const n = board.size();
	bool square = true;
	for (const auto& row : board) {
		if (row.size() != n) {
			square = false;
			break;
		}
	}
	auto const k = exact_sqrt(n);
	if (!square || !k || k.value() == 0) {
		for (const auto& row : board) {
			os << row << '\n';
		}
		return;
	}

	size_t const ks = k.value();
	for (size_t row = 0; row < n; ++row) {
		for (size_t col = 0; col < n; ++col) {
			os << board.at(row).at(col);
			if (col < n-1 && (col % ks) == (ks - 1)) {
				os << ' ';
			}
		}
		os << '\n';
		if (row < n-1 && (row % ks) == (ks - 1)) {
			os << '\n';
		}
	}
}


} // namespace validators
