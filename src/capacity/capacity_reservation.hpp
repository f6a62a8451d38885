#pragma once

#include <memory>
#include <optional>
#include <vodlink/kv_store.hpp>
#include <vodlink/types.hpp>

#include "store/keys.hpp"

namespace vodlink::capacity {

/// Per-profile connection cap shared by all workers, kept in one Redis
/// counter per profile and mutated only with INCR/DECR.
class CapacityReservation {
   public:
	CapacityReservation(std::shared_ptr<store::KeyValueStore> kv,
						store::KeySchema keys = store::KeySchema{});

	/// Take one slot. Unlimited profiles (max_connections == 0) always
	/// succeed without touching the counter. The counter is incremented
	/// first and rolled back when over the limit, so concurrent callers can
	/// never be over-admitted. Store errors count as "not reserved".
	bool reserve_slot(const ProviderProfile &profile);

	/// Give one slot back. The counter never goes below zero.
	void release(long long profile_id);

	/// Current counter value, 0 when the key does not exist.
	std::optional<long long> current(long long profile_id);

   private:
	std::shared_ptr<store::KeyValueStore> kv_;
	store::KeySchema keys_;
};

}  // namespace vodlink::capacity
