#include "validator.h"

#include <ostream>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>


namespace validators {


const char* to_string(ipv4_verdict_t v)
{
	switch (v) {
		case ipv4_verdict_t::ok: return "ok";
		case ipv4_verdict_t::wrong_segment_count: return "wrong_segment_count";
		case ipv4_verdict_t::empty_segment: return "empty_segment";
		case ipv4_verdict_t::segment_too_long: return "segment_too_long";
		case ipv4_verdict_t::non_digit: return "non_digit";
		case ipv4_verdict_t::out_of_range: return "out_of_range";
		case ipv4_verdict_t::leading_zero: return "leading_zero";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, ipv4_verdict_t v)
{
	return os << to_string(v);
}


namespace {

bool is_ascii_digit(char c)
{
	return c >= '0' && c <= '9';
}

} // namespace


ipv4_verdict_t check_ipv4_segment(const std::string& segment)
{
	if (segment.empty())
		return ipv4_verdict_t::empty_segment;
	if (segment.size() > ipv4_max_segment_length)
		return ipv4_verdict_t::segment_too_long;
	if (!boost::algorithm::all(segment, is_ascii_digit))
		return ipv4_verdict_t::non_digit;

	unsigned value = 0;
	if (!boost::conversion::try_lexical_convert(segment, value))
		return ipv4_verdict_t::non_digit;
	if (value > ipv4_max_segment_value)
		return ipv4_verdict_t::out_of_range;

	if (segment.size() > 1 && segment.front() == '0')
		return ipv4_verdict_t::leading_zero;
	return ipv4_verdict_t::ok;
}


ipv4_verdict_t check_ipv4(const std::string& candidate)
{
	// token_compress_off keeps the empty segments produced by leading, trailing or doubled dots
	std::vector<std::string> segments;
	boost::algorithm::split(segments, candidate, boost::algorithm::is_any_of("."), boost::algorithm::token_compress_off);
	if (segments.size() != ipv4_segments)
		return ipv4_verdict_t::wrong_segment_count;

	for (const auto& segment : segments) {
		auto const v = check_ipv4_segment(segment);
		if (v != ipv4_verdict_t::ok)
			return v;
	}
	return ipv4_verdict_t::ok;
}


bool is_valid_ipv4(const std::string& candidate)
{
	return check_ipv4(candidate) == ipv4_verdict_t::ok;
}


} // namespace validators
