#include "board_io.h"
#include "validator.h"

#include "../lib/log/log.h"

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>


namespace {

validators::board_t read_input(int argc, char** argv)
{
	if (argc < 2) {
		return validators::board_read(std::cin);
	}
	std::ifstream file(argv[1]);
	if (!file.is_open()) {
		throw std::runtime_error(std::string("can't open ") + argv[1]);
	}
	return validators::board_read(file);
}

} // namespace


int main(int argc, char** argv)
{
	try {
		auto const board = read_input(argc, argv);
		std::cout << "INPUT\n";
		validators::board_print(std::cout, board);
		std::cout << std::endl;

		auto const verdict = validators::check_sudoku(board);
		if (verdict == validators::sudoku_verdict_t::ok) {
			std::cout << "VALID" << std::endl;
			return 0;
		}
		std::cout << "INVALID: " << verdict << std::endl;
		return 1;

	} catch (const std::exception& e) {
		validators::log_t(std::cerr) << "Exception: " << e.what() << "\n";
		return 2;
	}
}
