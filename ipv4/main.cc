#include "validator.h"

#include "../lib/log/log.h"

#include <exception>
#include <iostream>
#include <string>

#include <boost/algorithm/string.hpp>


namespace {

bool report(const std::string& candidate)
{
	auto const verdict = validators::check_ipv4(candidate);
	if (verdict == validators::ipv4_verdict_t::ok) {
		std::cout << candidate << ": valid\n";
		return true;
	}
	std::cout << candidate << ": invalid (" << verdict << ")\n";
	return false;
}

} // namespace


int main(int argc, char** argv)
{
	try {
		bool all_valid = true;
		if (argc > 1) {
			for (int i = 1; i < argc; ++i) {
				all_valid = report(argv[i]) && all_valid;
			}
		} else {
			std::string line;
			while (std::getline(std::cin, line)) {
				// strip the line terminator only, other whitespace is part of the candidate
				boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of("\r\n"));
				all_valid = report(line) && all_valid;
			}
		}
		std::cout << std::flush;
		return all_valid ? 0 : 1;

	} catch (const std::exception& e) {
		validators::log_t(std::cerr) << "Exception: " << e.what() << "\n";
		return 2;
	}
}
