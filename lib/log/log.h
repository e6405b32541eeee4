#ifndef _validators_log_h_included_
#define _validators_log_h_included_

#include <ostream>
#include <sstream>
#include <string>


namespace validators {


// Collects one message and writes it to the target stream in a single call on destruction,
// so lines from concurrent writers are not interleaved.
class log_t {
	std::ostream& os_;
	std::ostringstream os_str_;
public:
	explicit log_t(std::ostream& os) : os_(os) {}
	log_t(const log_t&) = delete;
	log_t& operator=(const log_t&) = delete;

	template <typename T>
	std::ostream& operator<<(const T& t) {
		return os_str_ << t;
	}

	std::string pending() const { return os_str_.str(); }

	~log_t() {
		os_ << os_str_.str() << std::flush;
	}
};


} // namespace validators

#endif
