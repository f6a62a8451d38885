#include "capacity/capacity_reservation.hpp"

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace vodlink::capacity {

CapacityReservation::CapacityReservation(
	std::shared_ptr<store::KeyValueStore> kv, store::KeySchema keys)
	: kv_(std::move(kv)), keys_(std::move(keys)) {}

bool CapacityReservation::reserve_slot(const ProviderProfile &profile) {
	if (profile.max_connections <= 0) { return true; }

	const auto key = keys_.profile_connections(profile.id);
	auto count = kv_->increment(key);
	if (!count) {
		spdlog::error("Error reserving slot for profile {}: {}", profile.id,
					  count.error().message());
		return false;
	}

	if (count.value() <= profile.max_connections) {
		spdlog::info("[PROFILE-RESERVE] Profile {} slot reserved: {}/{}",
					 profile.id, count.value(), profile.max_connections);
		return true;
	}

	if (auto rolled_back = kv_->decrement(key); !rolled_back) {
		spdlog::error("Rollback of profile {} counter failed: {}", profile.id,
					  rolled_back.error().message());
	}
	spdlog::info("[PROFILE-RESERVE] Profile {} at capacity: {}/{}",
				 profile.id, count.value() - 1, profile.max_connections);
	return false;
}

void CapacityReservation::release(long long profile_id) {
	const auto key = keys_.profile_connections(profile_id);
	auto count = kv_->decrement(key);
	if (!count) {
		spdlog::error("Error releasing slot for profile {}: {}", profile_id,
					  count.error().message());
		return;
	}

	if (count.value() < 0) {
		// Undo: the counter was already at zero
		spdlog::warn("[PROFILE-DECR] Profile {} already at 0 connections",
					 profile_id);
		if (auto restored = kv_->increment(key); !restored) {
			spdlog::error("Restoring profile {} counter failed: {}",
						  profile_id, restored.error().message());
		}
		return;
	}
	spdlog::info(
		"[PROFILE-DECR] Profile {} connections: {}", profile_id, count.value());
}

std::optional<long long> CapacityReservation::current(long long profile_id) {
	auto raw = kv_->get(keys_.profile_connections(profile_id));
	if (!raw) { return std::nullopt; }
	if (!raw.value()) { return 0LL; }
	auto parsed = utils::to_long(*raw.value());
	if (!parsed) {
		spdlog::warn("Profile {} counter holds non-integer '{}'", profile_id,
					 *raw.value());
		return std::nullopt;
	}
	return parsed.value();
}

}  // namespace vodlink::capacity
