#pragma once

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/charconv.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vodlink/result.hpp>

namespace vodlink::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

// Wrappers for common uses
inline Result<int> to_int(std::string_view sv) { return to_number<int>(sv); }

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

// Fallback helper for fields where 0/empty is preferred over an error
template <typename T>
T to_number_default(std::string_view sv, T def_val = 0) {
	auto res = to_number<T>(sv);
	if (res) { return res.value(); }
	return def_val;
}

// =============================================================================
// Time helpers
// =============================================================================

/// Wall-clock seconds since the epoch, as stored in session records.
inline double now_seconds() {
	return std::chrono::duration<double>(
			   std::chrono::system_clock::now().time_since_epoch())
		.count();
}

// =============================================================================
// Header helpers
// =============================================================================

/// Case-insensitive lookup in a header map.
inline std::optional<std::string> find_header(
	const std::map<std::string, std::string> &headers, std::string_view name) {
	for (const auto &[key, value] : headers) {
		if (boost::algorithm::to_lower_copy(key) ==
			boost::algorithm::to_lower_copy(std::string(name))) {
			return value;
		}
	}
	return std::nullopt;
}

}  // namespace vodlink::utils
