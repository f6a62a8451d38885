#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vodlink/kv_store.hpp>

#include "capacity/capacity_reservation.hpp"
#include "session/session_store.hpp"

namespace vodlink::session {

struct SweepReport {
	std::size_t scanned = 0;
	std::size_t stale = 0;
	std::size_t removed = 0;
	std::size_t errors = 0;
};

/// Reclaims session records abandoned by crashed workers or vanished
/// clients: idle (active_streams == 0) and untouched for longer than
/// max_age. Removal goes through SessionStore::cleanup(), so the lock
/// re-check and the capacity release apply exactly as for a normal teardown.
class StaleSweeper {
   public:
	StaleSweeper(std::shared_ptr<store::KeyValueStore> kv,
				 std::shared_ptr<capacity::CapacityReservation> capacity,
				 SessionStoreOptions options, std::string worker_id);
	~StaleSweeper();

	StaleSweeper(const StaleSweeper &) = delete;
	StaleSweeper &operator=(const StaleSweeper &) = delete;

	SweepReport sweep(std::chrono::seconds max_age);

	/// Sweep every `interval` on `ex` until stop(). The first sweep runs
	/// after one interval.
	void start(boost::asio::any_io_executor ex, std::chrono::seconds interval,
			   std::chrono::seconds max_age);

	/// Cancel the periodic sweep. Safe to call from any thread.
	void stop();

	[[nodiscard]] bool is_running() const { return running_.load(); }

   private:
	void schedule();

	std::shared_ptr<store::KeyValueStore> kv_;
	std::shared_ptr<capacity::CapacityReservation> capacity_;
	SessionStoreOptions options_;
	std::string worker_id_;

	std::unique_ptr<boost::asio::steady_timer> timer_;
	std::chrono::seconds interval_{0};
	std::chrono::seconds max_age_{0};
	std::atomic<bool> running_{false};
};

}  // namespace vodlink::session
