#include "store/distributed_lock.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <random>
#include <thread>

namespace vodlink::store {

namespace {

std::string make_token() {
	thread_local boost::uuids::random_generator gen;
	return boost::uuids::to_string(gen());
}

std::chrono::milliseconds jittered(std::chrono::milliseconds base) {
	thread_local std::mt19937 rng{std::random_device{}()};
	std::uniform_int_distribution<long long> dist(0, base.count() / 2);
	return base + std::chrono::milliseconds(dist(rng));
}

}  // namespace

DistributedLock::DistributedLock(std::shared_ptr<KeyValueStore> store,
								 std::string key, LockOptions options)
	: store_(std::move(store)),
	  key_(std::move(key)),
	  token_(make_token()),
	  options_(options) {}

DistributedLock::~DistributedLock() { release(); }

Result<bool> DistributedLock::try_acquire() {
	if (held_) { return true; }
	auto res = store_->set_if_absent(key_, token_, options_.ttl);
	if (!res) { return res.error(); }
	held_ = res.value();
	return held_;
}

Result<void> DistributedLock::acquire() {
	const auto deadline = std::chrono::steady_clock::now() + options_.wait;
	auto backoff = options_.initial_backoff;

	while (true) {
		auto res = try_acquire();
		if (!res) { return res.error(); }
		if (res.value()) { return outcome::success(); }

		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			spdlog::warn("Timed out after {}ms waiting for lock {}",
						 options_.wait.count(), key_);
			return make_error_code(errc::lock_timeout);
		}

		auto sleep_for = std::min(
			jittered(backoff),
			std::chrono::duration_cast<std::chrono::milliseconds>(
				deadline - now));
		std::this_thread::sleep_for(sleep_for);
		backoff = std::min(backoff * 2, options_.max_backoff);
	}
}

void DistributedLock::release() {
	if (!held_) { return; }
	held_ = false;

	auto res = store_->delete_if_equals(key_, token_);
	if (!res) {
		// Key expiry reclaims it
		spdlog::warn("Failed to release lock {}: {}", key_,
					 res.error().message());
	} else if (!res.value()) {
		spdlog::warn("Lock {} expired before release", key_);
	}
}

}  // namespace vodlink::store
