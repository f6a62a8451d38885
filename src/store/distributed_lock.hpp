#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vodlink/kv_store.hpp>
#include <vodlink/result.hpp>

namespace vodlink::store {

struct LockOptions {
	// Expiry of the lock key; a crashed holder blocks others at most this long
	std::chrono::milliseconds ttl{10000};
	// How long acquire() keeps retrying before giving up
	std::chrono::milliseconds wait{5000};
	std::chrono::milliseconds initial_backoff{5};
	std::chrono::milliseconds max_backoff{200};
};

/// Advisory cross-process lock on a single Redis key.
///
/// Acquisition is SET NX PX with a per-instance random token, retried with
/// jittered exponential backoff until LockOptions::wait elapses. Release only
/// deletes the key if it still holds our token, so a holder that outlived its
/// TTL cannot drop somebody else's lock. The destructor releases a held lock.
class DistributedLock {
   public:
	DistributedLock(std::shared_ptr<KeyValueStore> store, std::string key,
					LockOptions options = {});
	~DistributedLock();

	DistributedLock(const DistributedLock &) = delete;
	DistributedLock &operator=(const DistributedLock &) = delete;

	/// Blocks up to options.wait. Fails with lock_timeout or
	/// store_unavailable.
	Result<void> acquire();

	/// Single attempt, no waiting.
	Result<bool> try_acquire();

	void release();

	[[nodiscard]] bool owns_lock() const { return held_; }
	[[nodiscard]] const std::string &key() const { return key_; }

   private:
	std::shared_ptr<KeyValueStore> store_;
	std::string key_;
	std::string token_;
	LockOptions options_;
	bool held_ = false;
};

}  // namespace vodlink::store
