// vodlink - Integration tests for the Redis store
//
// Runs against a live server named by VODLINK_TEST_REDIS_URI
// (e.g. tcp://127.0.0.1:6379/15) and is skipped otherwise. Every key is
// created under a per-run prefix and removed afterwards.

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>

#include "store/distributed_lock.hpp"
#include "store/keys.hpp"
#include "support/memory_store.hpp"

namespace vodlink {
namespace test {

using namespace std::chrono_literals;

class RedisStoreTest : public ::testing::Test {
   protected:
	void SetUp() override {
		const char *uri = std::getenv("VODLINK_TEST_REDIS_URI");
		if (!uri || std::string(uri).empty()) {
			GTEST_SKIP() << "VODLINK_TEST_REDIS_URI not set";
		}
		store::RedisOptions options;
		options.uri = uri;
		options.pool_size = 2;
		auto kv = store::make_redis_store(options);
		ASSERT_TRUE(kv) << kv.error().message();
		kv_ = kv.value();
		prefix_ = "vodlink-test:" +
				  std::to_string(std::chrono::steady_clock::now()
									 .time_since_epoch()
									 .count()) +
				  ":";
	}

	void TearDown() override {
		if (!kv_) { return; }
		auto keys = kv_->scan(prefix_ + "*");
		if (keys && !keys.value().empty()) {
			EXPECT_TRUE(kv_->remove(keys.value()));
		}
	}

	std::string key(const std::string &name) const { return prefix_ + name; }

	std::shared_ptr<store::KeyValueStore> kv_;
	std::string prefix_;
};

TEST_F(RedisStoreTest, HashRoundTripAndScan) {
	HashFields fields{{"session_id", "s1"}, {"stream_url", "http://x/y"}};
	ASSERT_TRUE(kv_->hash_set(key("session:s1"), fields, 60s));
	ASSERT_TRUE(kv_->set(key("session:s1:lock"), "token", 60s));

	auto read = kv_->hash_get_all(key("session:s1"));
	ASSERT_TRUE(read);
	EXPECT_EQ(read.value(), fields);

	auto keys = kv_->scan(key("session:*"));
	ASSERT_TRUE(keys);
	EXPECT_EQ(keys.value().size(), 2u);

	auto missing = kv_->hash_get_all(key("session:none"));
	ASSERT_TRUE(missing);
	EXPECT_TRUE(missing.value().empty());
}

TEST_F(RedisStoreTest, SetIfAbsentAndCompareDelete) {
	auto first = kv_->set_if_absent(key("lock"), "a", 5000ms);
	ASSERT_TRUE(first);
	EXPECT_TRUE(first.value());

	auto second = kv_->set_if_absent(key("lock"), "b", 5000ms);
	ASSERT_TRUE(second);
	EXPECT_FALSE(second.value());

	auto wrong = kv_->delete_if_equals(key("lock"), "b");
	ASSERT_TRUE(wrong);
	EXPECT_FALSE(wrong.value());

	auto right = kv_->delete_if_equals(key("lock"), "a");
	ASSERT_TRUE(right);
	EXPECT_TRUE(right.value());

	auto gone = kv_->exists(key("lock"));
	ASSERT_TRUE(gone);
	EXPECT_FALSE(gone.value());
}

TEST_F(RedisStoreTest, CountersIncrementAndDecrement) {
	EXPECT_EQ(kv_->increment(key("profile:1:connections")).value(), 1);
	EXPECT_EQ(kv_->increment(key("profile:1:connections")).value(), 2);
	EXPECT_EQ(kv_->decrement(key("profile:1:connections")).value(), 1);

	auto raw = kv_->get(key("profile:1:connections"));
	ASSERT_TRUE(raw);
	EXPECT_EQ(raw.value(), std::optional<std::string>("1"));
}

TEST_F(RedisStoreTest, LockWorksAgainstRedis) {
	store::LockOptions options;
	options.wait = 100ms;
	store::DistributedLock a(kv_, key("session:x:lock"), options);
	store::DistributedLock b(kv_, key("session:x:lock"), options);

	ASSERT_TRUE(a.acquire());
	auto blocked = b.acquire();
	ASSERT_FALSE(blocked);
	EXPECT_EQ(blocked.error(), errc::lock_timeout);

	a.release();
	EXPECT_TRUE(b.acquire());
}

// Keeps the in-memory store honest about Redis glob semantics
TEST(GlobMatchTest, MatchesRedisStylePatterns) {
	EXPECT_TRUE(MemoryStore::glob_match("vodlink:session:*", "vodlink:session:a"));
	EXPECT_TRUE(
		MemoryStore::glob_match("vodlink:session:*", "vodlink:session:a:lock"));
	EXPECT_FALSE(MemoryStore::glob_match("vodlink:session:*", "vodlink:profile:1"));
	EXPECT_TRUE(MemoryStore::glob_match("a?c", "abc"));
	EXPECT_FALSE(MemoryStore::glob_match("a?c", "ac"));
}

}  // namespace test
}  // namespace vodlink
