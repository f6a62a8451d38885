#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace vodlink {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Capacity / client errors
	capacity_exceeded = 10,
	range_not_satisfiable,

	// Upstream provider errors
	upstream_failed = 20,
	upstream_http_error,  // Non-2xx/3xx status
	invalid_url,
	too_many_redirects,

	// Coordination errors
	lock_timeout = 30,
	store_unavailable,
	session_not_found,

	// Decoding
	corrupt_record = 40,
	invalid_number_format,

	// Streaming
	stream_cancelled = 50,

	unknown = 100
};

std::error_code make_error_code(errc e);

}  // namespace vodlink

namespace std {
template <>
struct is_error_code_enum<vodlink::errc> : true_type {};
}  // namespace std

namespace vodlink {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace vodlink
