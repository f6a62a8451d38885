#pragma once

#include <vodlink/vodlink_export.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace vodlink {

/// Scores used when looking for an idle session to reuse. A candidate needs
/// the same content to be considered at all.
struct VODLINK_EXPORT MatchWeights {
	int content = 10;
	int client_ip = 5;
	int user_agent = 3;
	int timeshift = 7;	// requested timeshift, all three fields equal
	int threshold = 13;
};

struct VODLINK_EXPORT Config {
	// Redis
	std::string redis_uri = "tcp://127.0.0.1:6379";
	std::string key_prefix = "vodlink:";
	std::size_t redis_pool_size = 8;

	// Session records and locking
	std::chrono::seconds session_ttl{3600};
	std::chrono::milliseconds lock_ttl{10000};
	std::chrono::milliseconds lock_wait{5000};

	// Upstream
	std::chrono::milliseconds connect_timeout{10000};
	std::chrono::milliseconds read_timeout{10000};
	std::string upstream_user_agent = "vodlink/1.0";

	// Streaming
	std::size_t chunk_size = 8192;
	int stop_check_interval = 100;	// chunks
	std::chrono::milliseconds cleanup_delay{1000};

	// Stale sweep
	std::chrono::seconds stale_max_age{1800};
	std::chrono::seconds sweep_interval{300};

	MatchWeights match;

	// Empty means default_worker_id()
	std::string worker_id;
};

/// "<hostname>-<pid>"
VODLINK_EXPORT std::string default_worker_id();

}  // namespace vodlink
