#include "session/stale_sweeper.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include "utils.hpp"

namespace vodlink::session {

StaleSweeper::StaleSweeper(
	std::shared_ptr<store::KeyValueStore> kv,
	std::shared_ptr<capacity::CapacityReservation> capacity,
	SessionStoreOptions options, std::string worker_id)
	: kv_(std::move(kv)),
	  capacity_(std::move(capacity)),
	  options_(std::move(options)),
	  worker_id_(std::move(worker_id)) {}

StaleSweeper::~StaleSweeper() { running_.store(false); }

SweepReport StaleSweeper::sweep(std::chrono::seconds max_age) {
	SweepReport report;
	spdlog::info("Cleaning up sessions idle for more than {} seconds",
				 max_age.count());

	auto keys = kv_->scan(options_.keys.session_pattern());
	if (!keys) {
		spdlog::error("Stale sweep scan failed: {}", keys.error().message());
		report.errors++;
		return report;
	}

	const auto now = utils::now_seconds();
	const auto limit = static_cast<double>(max_age.count());
	CapacityRelease release;
	if (capacity_) {
		release = [this](long long profile_id) {
			capacity_->release(profile_id);
		};
	}

	for (const auto &key : keys.value()) {
		auto id = options_.keys.session_id_from_key(key);
		if (id.empty()) { continue; }

		auto fields = kv_->hash_get_all(key);
		if (!fields) {
			report.errors++;
			continue;
		}
		if (fields.value().empty()) { continue; }
		report.scanned++;

		auto state = from_hash(fields.value());
		if (!state) {
			spdlog::error("[{}] Skipping unreadable record during sweep", id);
			report.errors++;
			continue;
		}

		if (now - state.value().last_activity <= limit ||
			state.value().active_streams != 0) {
			continue;
		}

		report.stale++;
		spdlog::info("[{}] Cleaning up stale session", id);
		SessionStore store(id, kv_, nullptr, options_);
		auto removed = store.cleanup(worker_id_, release);
		if (!removed) {
			report.errors++;
		} else if (removed.value()) {
			report.removed++;
		}
	}

	if (report.removed > 0) {
		spdlog::info("Cleaned up {} stale sessions", report.removed);
	} else {
		spdlog::debug("No stale sessions found");
	}
	return report;
}

void StaleSweeper::start(boost::asio::any_io_executor ex,
						 std::chrono::seconds interval,
						 std::chrono::seconds max_age) {
	interval_ = interval;
	max_age_ = max_age;
	timer_ = std::make_unique<boost::asio::steady_timer>(ex);
	running_.store(true);
	spdlog::info("Stale sweep every {}s (max age {}s)", interval.count(),
				 max_age.count());
	schedule();
}

void StaleSweeper::stop() {
	if (!running_.exchange(false) || !timer_) { return; }
	boost::asio::post(timer_->get_executor(), [this] {
		if (timer_) { timer_->cancel(); }
	});
}

void StaleSweeper::schedule() {
	timer_->expires_after(interval_);
	timer_->async_wait([this](const boost::system::error_code &ec) {
		if (ec == boost::asio::error::operation_aborted || !running_.load()) {
			return;
		}
		if (ec) {
			spdlog::error("Sweep timer failed: {}", ec.message());
			return;
		}
		sweep(max_age_);
		if (running_.load()) { schedule(); }
	});
}

}  // namespace vodlink::session
