#pragma once

#include <vodlink/vodlink_export.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <vodlink/connection_state.hpp>
#include <vodlink/result.hpp>

namespace vodlink::store {

/// The subset of Redis commands the session protocol relies on.
///
/// Every operation is a single atomic server-side command (or a MULTI/EXEC
/// block for hash_set), so implementations must not split them.
class VODLINK_EXPORT KeyValueStore {
   public:
	virtual ~KeyValueStore() = default;

	// Hashes
	virtual Result<HashFields> hash_get_all(std::string_view key) = 0;
	// HSET all fields + EXPIRE, atomically
	virtual Result<void> hash_set(std::string_view key,
								  const HashFields &fields,
								  std::chrono::seconds ttl) = 0;

	// Strings
	virtual Result<std::optional<std::string>> get(std::string_view key) = 0;
	virtual Result<void> set(std::string_view key, std::string_view value,
							 std::chrono::seconds ttl) = 0;
	// SET key value NX PX ttl
	virtual Result<bool> set_if_absent(std::string_view key,
									   std::string_view value,
									   std::chrono::milliseconds ttl) = 0;
	// DEL key only if its value still equals `expected`
	virtual Result<bool> delete_if_equals(std::string_view key,
										  std::string_view expected) = 0;

	// Counters
	virtual Result<long long> increment(std::string_view key) = 0;
	virtual Result<long long> decrement(std::string_view key) = 0;

	// Keyspace
	virtual Result<bool> exists(std::string_view key) = 0;
	virtual Result<long long> remove(const std::vector<std::string> &keys) = 0;
	// Full SCAN iteration for a glob pattern
	virtual Result<std::vector<std::string>> scan(std::string_view pattern) = 0;
};

struct VODLINK_EXPORT RedisOptions {
	std::string uri = "tcp://127.0.0.1:6379";
	std::chrono::milliseconds socket_timeout{5000};
	std::chrono::milliseconds connect_timeout{5000};
	std::size_t pool_size = 8;
};

/// Connect to Redis. Fails with store_unavailable when the initial PING does.
VODLINK_EXPORT Result<std::shared_ptr<KeyValueStore>> make_redis_store(
	const RedisOptions &options);

}  // namespace vodlink::store
