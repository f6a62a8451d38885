#include "stream/byte_range.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>

#include "utils.hpp"

namespace vodlink::stream {

namespace {

constexpr std::string_view kBytesUnit = "bytes=";

std::optional<long long> parse_position(std::string_view sv) {
	auto s = boost::algorithm::trim_copy(std::string(sv));
	if (s.empty()) { return std::nullopt; }
	auto res = utils::to_long(s);
	if (!res || res.value() < 0) { return std::nullopt; }
	return res.value();
}

}  // namespace

std::optional<RangeSpec> parse_range_header(std::string_view header) {
	if (header.substr(0, kBytesUnit.size()) != kBytesUnit) {
		return std::nullopt;
	}
	auto body = header.substr(kBytesUnit.size());

	// Multi-range requests are not rewritten
	if (body.find(',') != std::string_view::npos) { return std::nullopt; }

	auto dash = body.find('-');
	if (dash == std::string_view::npos) { return std::nullopt; }

	auto first_sv = body.substr(0, dash);
	auto last_sv = body.substr(dash + 1);

	RangeSpec spec;
	if (!boost::algorithm::trim_copy(std::string(first_sv)).empty()) {
		spec.first = parse_position(first_sv);
		if (!spec.first) { return std::nullopt; }
	}
	if (!boost::algorithm::trim_copy(std::string(last_sv)).empty()) {
		spec.last = parse_position(last_sv);
		if (!spec.last) { return std::nullopt; }
	}

	if (!spec.first && !spec.last) { return std::nullopt; }
	return spec;
}

Result<ByteRange> resolve_range(const RangeSpec &spec, long long length) {
	if (length <= 0) { return make_error_code(errc::range_not_satisfiable); }

	ByteRange r;
	if (!spec.first) {
		// Suffix: the last N bytes
		if (*spec.last == 0) {
			return make_error_code(errc::range_not_satisfiable);
		}
		r.start = *spec.last >= length ? 0 : length - *spec.last;
		r.end = length - 1;
		return r;
	}

	r.start = *spec.first;
	if (r.start >= length) {
		return make_error_code(errc::range_not_satisfiable);
	}
	r.end = spec.last ? std::min(*spec.last, length - 1) : length - 1;
	if (r.start > r.end) {
		return make_error_code(errc::range_not_satisfiable);
	}
	return r;
}

std::string to_range_header(const ByteRange &range) {
	return fmt::format("bytes={}-{}", range.start, range.end);
}

std::string to_content_range(const ByteRange &range, long long total) {
	return fmt::format("bytes {}-{}/{}", range.start, range.end, total);
}

std::optional<long long> content_range_total(std::string_view value) {
	auto slash = value.rfind('/');
	if (slash == std::string_view::npos) { return std::nullopt; }
	auto total = utils::to_long(value.substr(slash + 1));
	if (!total || total.value() < 0) { return std::nullopt; }
	return total.value();
}

}  // namespace vodlink::stream
