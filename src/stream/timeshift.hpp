#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vodlink/types.hpp>

namespace vodlink::stream {

// Path segments used by catch-up URLs: "YYYY-MM-DD" and "HH-MM-SS"
struct CatchupStamp {
	std::string date;
	std::string time;
};

/// Parse an ISO-8601 timestamp ("2024-03-01T20:15:00Z", "+02:00" offsets,
/// fractional seconds, or a bare date). The wall-clock fields are kept as
/// written; no time zone conversion happens.
std::optional<CatchupStamp> parse_iso_timestamp(std::string_view value);

/// Rewrite a provider URL for a timeshift request.
///
/// Sets utc_start+start, utc_end+end and offset+seek+t query parameters
/// (offset only when it is an integer), and moves a
/// /catchup/YYYY-MM-DD/HH-MM-SS/ path segment to utc_start. Steps that
/// cannot be applied are skipped; an unparsable URL is returned unchanged.
std::string apply_timeshift(const std::string &url,
							const TimeshiftParams &params);

}  // namespace vodlink::stream
