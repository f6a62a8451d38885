// vodlink - Tests for the session lock
//
// Tests cover:
// - Mutual exclusion between holders of the same key
// - Bounded waiting and lock_timeout
// - Token-checked release and release on destruction
// - Recovery after a holder's TTL lapses

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "store/distributed_lock.hpp"
#include "support/memory_store.hpp"

namespace vodlink {
namespace test {

using namespace std::chrono_literals;

class DistributedLockTest : public ::testing::Test {
   protected:
	void SetUp() override {
		kv_ = std::make_shared<MemoryStore>();
		options_.ttl = 10000ms;
		options_.wait = 200ms;
		options_.initial_backoff = 1ms;
		options_.max_backoff = 10ms;
	}

	std::shared_ptr<MemoryStore> kv_;
	store::LockOptions options_;
};

// =============================================================================
// Acquisition
// =============================================================================

TEST_F(DistributedLockTest, SecondHolderCannotAcquireHeldLock) {
	store::DistributedLock first(kv_, "vodlink:session:a:lock", options_);
	store::DistributedLock second(kv_, "vodlink:session:a:lock", options_);

	ASSERT_TRUE(first.acquire());
	EXPECT_TRUE(first.owns_lock());

	auto attempt = second.try_acquire();
	ASSERT_TRUE(attempt);
	EXPECT_FALSE(attempt.value());
	EXPECT_FALSE(second.owns_lock());
}

TEST_F(DistributedLockTest, AcquireTimesOutWhileHeld) {
	store::DistributedLock holder(kv_, "k", options_);
	ASSERT_TRUE(holder.acquire());

	store::DistributedLock waiter(kv_, "k", options_);
	auto start = std::chrono::steady_clock::now();
	auto res = waiter.acquire();
	auto waited = std::chrono::steady_clock::now() - start;

	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), errc::lock_timeout);
	EXPECT_GE(waited, options_.wait);
	EXPECT_GT(kv_->set_if_absent_calls(), 2u);
}

TEST_F(DistributedLockTest, WaiterGetsLockOnceReleased) {
	auto holder = std::make_unique<store::DistributedLock>(kv_, "k", options_);
	ASSERT_TRUE(holder->acquire());

	options_.wait = 2000ms;
	store::DistributedLock waiter(kv_, "k", options_);
	std::thread releaser([&] {
		std::this_thread::sleep_for(30ms);
		holder.reset();
	});

	EXPECT_TRUE(waiter.acquire());
	releaser.join();
	EXPECT_TRUE(waiter.owns_lock());
}

TEST_F(DistributedLockTest, StoreFailureIsReported) {
	kv_->fail_all = true;
	store::DistributedLock lock(kv_, "k", options_);
	auto res = lock.acquire();
	ASSERT_FALSE(res);
	EXPECT_EQ(res.error(), errc::store_unavailable);
}

// =============================================================================
// Release
// =============================================================================

TEST_F(DistributedLockTest, DestructorReleasesLock) {
	{
		store::DistributedLock lock(kv_, "k", options_);
		ASSERT_TRUE(lock.acquire());
		EXPECT_TRUE(kv_->string_value("k").has_value());
	}
	EXPECT_FALSE(kv_->string_value("k").has_value());
}

TEST_F(DistributedLockTest, ReleaseKeepsAnotherHoldersLock) {
	options_.ttl = 20ms;
	store::DistributedLock stale(kv_, "k", options_);
	ASSERT_TRUE(stale.acquire());

	// TTL lapses and somebody else takes the lock
	std::this_thread::sleep_for(40ms);
	options_.ttl = 10000ms;
	store::DistributedLock fresh(kv_, "k", options_);
	ASSERT_TRUE(fresh.acquire());

	stale.release();
	EXPECT_FALSE(stale.owns_lock());
	EXPECT_TRUE(kv_->string_value("k").has_value());

	auto other = store::DistributedLock(kv_, "k", options_).try_acquire();
	ASSERT_TRUE(other);
	EXPECT_FALSE(other.value());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(DistributedLockTest, CriticalSectionsNeverOverlap) {
	options_.wait = 5000ms;
	std::atomic<int> inside{0};
	std::atomic<int> max_inside{0};
	std::atomic<int> entered{0};

	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&] {
			for (int j = 0; j < 10; ++j) {
				store::DistributedLock lock(kv_, "k", options_);
				if (!lock.acquire()) { continue; }
				auto now = ++inside;
				int prev = max_inside.load();
				while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {
				}
				entered++;
				std::this_thread::sleep_for(100us);
				--inside;
			}
		});
	}
	for (auto &t : threads) { t.join(); }

	EXPECT_EQ(max_inside.load(), 1);
	EXPECT_EQ(entered.load(), 80);
}

}  // namespace test
}  // namespace vodlink
