#pragma once

#include <vodlink/vodlink_export.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace vodlink {

enum class ContentKind : std::uint8_t { movie, episode };

VODLINK_EXPORT std::string_view to_string(ContentKind kind);
VODLINK_EXPORT std::optional<ContentKind> parse_content_kind(
	std::string_view s);

// Content identity as supplied by the catalog layer
struct VODLINK_EXPORT ContentRef {
	ContentKind kind = ContentKind::movie;
	std::string id;	   // catalog uuid
	std::string name;  // display name, logging only
};

// Upstream provider account profile
struct VODLINK_EXPORT ProviderProfile {
	long long id = 0;
	int max_connections = 0;  // 0 = unlimited
	std::string user_agent;	  // account-level agent, may be empty
};

// Catch-up / timeshift request parameters, kept as the client sent them
struct VODLINK_EXPORT TimeshiftParams {
	std::string utc_start;
	std::string utc_end;
	std::string offset;

	[[nodiscard]] bool empty() const {
		return utc_start.empty() && utc_end.empty() && offset.empty();
	}

	bool operator==(const TimeshiftParams &) const = default;
};

struct VODLINK_EXPORT ClientInfo {
	std::string ip;
	std::string user_agent;
};

/// One inbound play/seek request, already resolved by the routing layer.
struct VODLINK_EXPORT StreamRequest {
	std::string session_id;	 // may be empty, one is generated
	ContentRef content;
	std::string stream_url;	 // provider URL for the content
	ProviderProfile profile;
	ClientInfo client;
	TimeshiftParams timeshift;
	std::optional<std::string> range_header;  // raw "Range" value

	// Client request headers considered for forwarding upstream
	std::map<std::string, std::string> client_headers;
};

}  // namespace vodlink
