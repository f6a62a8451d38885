#include <spdlog/spdlog.h>

#include <iterator>
#include <sw/redis++/redis++.h>
#include <vodlink/kv_store.hpp>

namespace vodlink::store {

namespace {

// Compare-and-delete so a lock holder never removes a lock that expired and
// was re-acquired by another worker.
constexpr std::string_view kDeleteIfEqualsScript = R"lua(
if redis.call('GET', KEYS[1]) == ARGV[1] then
	return redis.call('DEL', KEYS[1])
end
return 0
)lua";

constexpr long long kScanBatch = 100;

std::error_code log_store_error(std::string_view op, std::string_view key,
								const sw::redis::Error &e) {
	spdlog::error("Redis {} failed for key={}: {}", op, key, e.what());
	return make_error_code(errc::store_unavailable);
}

}  // namespace

class RedisStore final : public KeyValueStore {
   public:
	explicit RedisStore(sw::redis::Redis redis) : redis_(std::move(redis)) {}

	Result<HashFields> hash_get_all(std::string_view key) override {
		try {
			HashFields out;
			redis_.hgetall(key, std::inserter(out, out.end()));
			return out;
		} catch (const sw::redis::Error &e) {
			return log_store_error("HGETALL", key, e);
		}
	}

	Result<void> hash_set(std::string_view key, const HashFields &fields,
						  std::chrono::seconds ttl) override {
		try {
			auto tx = redis_.transaction();
			tx.hset(key, fields.begin(), fields.end()).expire(key, ttl).exec();
			return outcome::success();
		} catch (const sw::redis::Error &e) {
			return log_store_error("HSET", key, e);
		}
	}

	Result<std::optional<std::string>> get(std::string_view key) override {
		try {
			auto val = redis_.get(key);
			if (!val) { return std::optional<std::string>{}; }
			return std::optional<std::string>(*val);
		} catch (const sw::redis::Error &e) {
			return log_store_error("GET", key, e);
		}
	}

	Result<void> set(std::string_view key, std::string_view value,
					 std::chrono::seconds ttl) override {
		try {
			redis_.set(key, value, ttl);
			return outcome::success();
		} catch (const sw::redis::Error &e) {
			return log_store_error("SET", key, e);
		}
	}

	Result<bool> set_if_absent(std::string_view key, std::string_view value,
							   std::chrono::milliseconds ttl) override {
		try {
			return redis_.set(
				key, value, ttl, sw::redis::UpdateType::NOT_EXIST);
		} catch (const sw::redis::Error &e) {
			return log_store_error("SET NX", key, e);
		}
	}

	Result<bool> delete_if_equals(std::string_view key,
								  std::string_view expected) override {
		try {
			auto removed = redis_.eval<long long>(
				kDeleteIfEqualsScript, {key}, {expected});
			return removed > 0;
		} catch (const sw::redis::Error &e) {
			return log_store_error("EVAL compare-and-delete", key, e);
		}
	}

	Result<long long> increment(std::string_view key) override {
		try {
			return redis_.incr(key);
		} catch (const sw::redis::Error &e) {
			return log_store_error("INCR", key, e);
		}
	}

	Result<long long> decrement(std::string_view key) override {
		try {
			return redis_.decr(key);
		} catch (const sw::redis::Error &e) {
			return log_store_error("DECR", key, e);
		}
	}

	Result<bool> exists(std::string_view key) override {
		try {
			return redis_.exists(key) > 0;
		} catch (const sw::redis::Error &e) {
			return log_store_error("EXISTS", key, e);
		}
	}

	Result<long long> remove(const std::vector<std::string> &keys) override {
		if (keys.empty()) { return 0LL; }
		try {
			return redis_.del(keys.begin(), keys.end());
		} catch (const sw::redis::Error &e) {
			return log_store_error("DEL", keys.front(), e);
		}
	}

	Result<std::vector<std::string>> scan(std::string_view pattern) override {
		try {
			std::vector<std::string> keys;
			sw::redis::Cursor cursor = 0;
			do {
				cursor = redis_.scan(
					cursor, pattern, kScanBatch, std::back_inserter(keys));
			} while (cursor != 0);
			return keys;
		} catch (const sw::redis::Error &e) {
			return log_store_error("SCAN", pattern, e);
		}
	}

   private:
	sw::redis::Redis redis_;
};

Result<std::shared_ptr<KeyValueStore>> make_redis_store(
	const RedisOptions &options) {
	try {
		sw::redis::ConnectionOptions conn(options.uri);
		conn.socket_timeout = options.socket_timeout;
		conn.connect_timeout = options.connect_timeout;

		sw::redis::ConnectionPoolOptions pool;
		pool.size = options.pool_size;

		sw::redis::Redis redis(conn, pool);
		redis.ping();
		spdlog::info("Connected to Redis at {}", options.uri);
		return std::shared_ptr<KeyValueStore>(
			std::make_shared<RedisStore>(std::move(redis)));
	} catch (const sw::redis::Error &e) {
		spdlog::error("Failed to connect to Redis at {}: {}", options.uri,
					  e.what());
		return make_error_code(errc::store_unavailable);
	}
}

}  // namespace vodlink::store
