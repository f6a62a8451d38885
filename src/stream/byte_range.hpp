#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vodlink/result.hpp>

namespace vodlink::stream {

/// A single "bytes=" range as sent by the client, not yet checked against
/// the content length. `first` empty means a suffix range ("bytes=-N").
struct RangeSpec {
	std::optional<long long> first;
	std::optional<long long> last;
};

/// Inclusive byte interval within a resource of known length.
struct ByteRange {
	long long start = 0;
	long long end = 0;

	[[nodiscard]] long long length() const { return end - start + 1; }
};

/// Parse a Range header value. Returns nullopt for anything other than a
/// single well-formed "bytes=" range; such headers are passed upstream
/// untouched.
std::optional<RangeSpec> parse_range_header(std::string_view header);

/// Resolve against a known length, clamping the end to length - 1.
/// Fails with range_not_satisfiable when start >= length or start > end.
Result<ByteRange> resolve_range(const RangeSpec &spec, long long length);

/// "bytes=start-end"
std::string to_range_header(const ByteRange &range);

/// "bytes start-end/total"
std::string to_content_range(const ByteRange &range, long long total);

/// Total size from a Content-Range response value ("bytes 0-1023/4096").
/// nullopt for "*" or anything malformed.
std::optional<long long> content_range_total(std::string_view value);

}  // namespace vodlink::stream
