#ifndef _validators_ipv4_validator_h_included_
#define _validators_ipv4_validator_h_included_

#include <iosfwd>
#include <string>

#include <stddef.h>


namespace validators {


enum class ipv4_verdict_t {
	ok,
	wrong_segment_count,
	empty_segment,
	segment_too_long,
	non_digit,
	out_of_range,
	leading_zero,
};

const char* to_string(ipv4_verdict_t v);
std::ostream& operator<<(std::ostream& os, ipv4_verdict_t v);


constexpr size_t ipv4_segments = 4;
constexpr size_t ipv4_max_segment_length = 3;
constexpr unsigned ipv4_max_segment_value = 255;

ipv4_verdict_t check_ipv4_segment(const std::string& segment);

// Dotted-quad without leading zeros, e.g. "192.168.1.1". Never throws.
ipv4_verdict_t check_ipv4(const std::string& candidate);

bool is_valid_ipv4(const std::string& candidate);


} // namespace validators

#endif
