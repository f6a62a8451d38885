#pragma once

#include <vodlink/vodlink_export.h>

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vodlink/result.hpp>
#include <vodlink/types.hpp>

namespace vodlink {

/// Redis hash representation of a record: field name -> string value.
using HashFields = std::unordered_map<std::string, std::string>;

/// One logical viewing session, as persisted in the session hash.
///
/// All fields are plain data; the session lock in SessionStore is what makes
/// read-modify-write sequences on this record safe across workers.
struct VODLINK_EXPORT ConnectionState {
	std::string session_id;

	// Upstream descriptor
	std::string stream_url;
	std::string final_url;	// post-redirect, write-once
	std::map<std::string, std::string> request_headers;
	std::optional<long long> content_length;  // write-once
	std::string content_type;				  // write-once

	// Ownership / liveness
	std::string worker_id;
	double last_activity = 0.0;
	double created_at = 0.0;
	int active_streams = 0;
	long long request_count = 0;

	// Client / session metadata
	ContentKind content_kind = ContentKind::movie;
	std::string content_id;
	std::string content_name;
	std::string client_ip;
	std::string client_user_agent;
	TimeshiftParams timeshift;

	// Capacity linkage. capacity_held is true while this session owns one
	// slot of the profile counter; it is flipped only under the session lock.
	std::optional<long long> profile_id;
	bool capacity_held = false;

	// Seek / telemetry
	long long bytes_sent = 0;
	long long position_seconds = 0;
	long long last_seek_byte = 0;
	double last_seek_percentage = 0.0;
	long long total_content_size = 0;
	double last_seek_timestamp = 0.0;

	[[nodiscard]] const std::string &target_url() const {
		return final_url.empty() ? stream_url : final_url;
	}
};

/// Serialize every field; absent optionals become empty strings.
VODLINK_EXPORT HashFields to_hash(const ConnectionState &state);

/// Rebuild a record from a hash. Requires session_id and stream_url; other
/// missing fields take their defaults. Malformed values yield corrupt_record.
VODLINK_EXPORT Result<ConnectionState> from_hash(const HashFields &fields);

// JSON Serialization (operator tooling)
VODLINK_EXPORT void to_json(nlohmann::json &j, const ConnectionState &s);

}  // namespace vodlink
