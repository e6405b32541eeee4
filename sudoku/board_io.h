#ifndef _validators_sudoku_board_io_h_included_
#define _validators_sudoku_board_io_h_included_

#include "validator.h"

#include <iosfwd>


namespace validators {


// One row per non-blank line, surrounding whitespace trimmed. No validation is done here.
board_t board_read(std::istream& is);

void board_print(std::ostream& os, const board_t& board);


} // namespace validators

#endif
