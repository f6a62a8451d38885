// vodlink - Tests for SessionStore
//
// Tests cover:
// - Create-once semantics and record defaults
// - Reference counting of active streams
// - Upstream open: request accounting, write-once descriptor fields,
//   range validation and forwarding
// - Capacity flag handshake (claim / drop / release-if-idle)
// - Ownership-checked cleanup, including a stream starting mid-cleanup

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "session/session_store.hpp"
#include "support/memory_store.hpp"

namespace vodlink {
namespace test {

using namespace std::chrono_literals;

class SessionStoreTest : public ::testing::Test {
   protected:
	void SetUp() override {
		kv_ = std::make_shared<MemoryStore>();
		upstream_ = std::make_shared<FakeUpstream>(std::string(5000, 'x'));
		options_.lock.wait = 500ms;
		options_.lock.initial_backoff = 1ms;
	}

	std::unique_ptr<session::SessionStore> make_store(const std::string &id) {
		return std::make_unique<session::SessionStore>(id, kv_, upstream_,
													   options_);
	}

	ConnectionState initial(const std::string &id) {
		ConnectionState s;
		s.session_id = id;
		s.stream_url = "http://provider.example/movie/1.mp4";
		s.worker_id = "worker-a";
		s.content_id = "movie-1";
		s.profile_id = 3;
		return s;
	}

	ConnectionState stored(const std::string &id) {
		auto state = from_hash(kv_->hash("vodlink:session:" + id));
		EXPECT_TRUE(state);
		return state ? state.value() : ConnectionState{};
	}

	std::shared_ptr<MemoryStore> kv_;
	std::shared_ptr<FakeUpstream> upstream_;
	session::SessionStoreOptions options_;
};

// =============================================================================
// Create / fetch
// =============================================================================

TEST_F(SessionStoreTest, CreateWritesRecordOnce) {
	auto store = make_store("s1");
	auto first = store->create(initial("s1"));
	ASSERT_TRUE(first);
	EXPECT_TRUE(first.value());

	auto again = initial("s1");
	again.worker_id = "worker-b";
	auto second = store->create(again);
	ASSERT_TRUE(second);
	EXPECT_FALSE(second.value());

	auto state = stored("s1");
	EXPECT_EQ(state.worker_id, "worker-a");
	EXPECT_GT(state.created_at, 0.0);
	EXPECT_GT(state.last_activity, 0.0);
	EXPECT_EQ(state.active_streams, 0);
}

TEST_F(SessionStoreTest, FetchMissingRecordIsEmpty) {
	auto res = make_store("nope")->fetch();
	ASSERT_TRUE(res);
	EXPECT_FALSE(res.value().has_value());
}

// =============================================================================
// Reference counting
// =============================================================================

TEST_F(SessionStoreTest, IncrementAndDecrementActiveStreams) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	EXPECT_EQ(store->increment_active(), 1);
	EXPECT_EQ(store->increment_active(), 2);
	EXPECT_TRUE(store->has_active_streams());

	EXPECT_TRUE(store->decrement_active());
	EXPECT_TRUE(store->decrement_active());
	EXPECT_FALSE(store->decrement_active());
	EXPECT_FALSE(store->has_active_streams());
	EXPECT_EQ(stored("s1").active_streams, 0);
}

TEST_F(SessionStoreTest, CountingWithoutRecordFails) {
	auto store = make_store("ghost");
	EXPECT_EQ(store->increment_active(), 0);
	EXPECT_FALSE(store->decrement_active());
}

TEST_F(SessionStoreTest, ConcurrentIncrementsAreNotLost) {
	ASSERT_TRUE(make_store("s1")->create(initial("s1")));
	options_.lock.wait = 5000ms;

	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&] {
			auto store = make_store("s1");
			for (int j = 0; j < 5; ++j) { store->increment_active(); }
		});
	}
	for (auto &t : threads) { t.join(); }

	EXPECT_EQ(stored("s1").active_streams, 40);
}

// =============================================================================
// Upstream
// =============================================================================

TEST_F(SessionStoreTest, OpenUpstreamFillsDescriptorOnce) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	upstream_->final_url = "http://cdn.example/1.mp4";

	auto handle = store->open_upstream(std::nullopt);
	ASSERT_TRUE(handle) << handle.error().message();
	EXPECT_EQ(handle.value().state.content_length, 5000);
	EXPECT_EQ(handle.value().state.content_type, "video/mp4");
	EXPECT_EQ(handle.value().state.final_url, "http://cdn.example/1.mp4");
	EXPECT_EQ(handle.value().state.request_count, 1);
	EXPECT_FALSE(handle.value().range.has_value());

	// Second request goes to the resolved URL and keeps the first values
	upstream_->content_type = "application/octet-stream";
	auto second = store->open_upstream(std::nullopt);
	ASSERT_TRUE(second);
	EXPECT_EQ(upstream_->last_request().url, "http://cdn.example/1.mp4");
	EXPECT_FALSE(upstream_->last_request().follow_redirects);
	EXPECT_EQ(second.value().state.content_type, "video/mp4");
	EXPECT_EQ(stored("s1").request_count, 2);
}

TEST_F(SessionStoreTest, MissingContentTypeIsInferredFromUrl) {
	auto state = initial("s1");
	state.stream_url = "http://provider.example/movie/1.mkv";
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(state));
	upstream_->content_type.clear();

	auto handle = store->open_upstream(std::nullopt);
	ASSERT_TRUE(handle);
	EXPECT_EQ(handle.value().state.content_type, "video/x-matroska");
}

TEST_F(SessionStoreTest, RangeIsClampedAgainstKnownLength) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	ASSERT_TRUE(store->open_upstream(std::nullopt));

	auto handle = store->open_upstream(std::string("bytes=4000-9999"));
	ASSERT_TRUE(handle);
	ASSERT_TRUE(handle.value().range.has_value());
	EXPECT_EQ(handle.value().range->start, 4000);
	EXPECT_EQ(handle.value().range->end, 4999);
	EXPECT_EQ(upstream_->last_request().headers.at("Range"), "bytes=4000-4999");
	EXPECT_EQ(handle.value().response.status_code, 206);
}

TEST_F(SessionStoreTest, UnsatisfiableRangeFailsWithoutUpstreamCall) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	ASSERT_TRUE(store->open_upstream(std::nullopt));
	const auto calls = upstream_->calls();

	auto handle = store->open_upstream(std::string("bytes=6000-"));
	ASSERT_FALSE(handle);
	EXPECT_EQ(handle.error(), errc::range_not_satisfiable);
	EXPECT_EQ(upstream_->calls(), calls);
}

TEST_F(SessionStoreTest, RangeWithUnknownLengthIsPassedThrough) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	auto handle = store->open_upstream(std::string("bytes=1000-1999"));
	ASSERT_TRUE(handle);
	EXPECT_EQ(upstream_->last_request().headers.at("Range"), "bytes=1000-1999");
	// Length learned from Content-Range: the range is resolved afterwards
	EXPECT_EQ(handle.value().state.content_length, 5000);
	ASSERT_TRUE(handle.value().range.has_value());
	EXPECT_EQ(handle.value().range->length(), 1000);
}

TEST_F(SessionStoreTest, UpstreamFailureIsReported) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	upstream_->fail_with = make_error_code(errc::upstream_failed);

	auto handle = store->open_upstream(std::nullopt);
	ASSERT_FALSE(handle);
	EXPECT_EQ(handle.error(), errc::upstream_failed);
	EXPECT_EQ(stored("s1").request_count, 0);
}

TEST_F(SessionStoreTest, OpenWithoutRecordFails) {
	auto handle = make_store("ghost")->open_upstream(std::nullopt);
	ASSERT_FALSE(handle);
	EXPECT_EQ(handle.error(), errc::session_not_found);
}

// =============================================================================
// Capacity flag
// =============================================================================

TEST_F(SessionStoreTest, CapacityIsClaimedAndReleasedExactlyOnce) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	auto claim = store->claim_capacity(3);
	ASSERT_TRUE(claim);
	EXPECT_TRUE(claim.value());
	auto again = store->claim_capacity(3);
	ASSERT_TRUE(again);
	EXPECT_FALSE(again.value());

	auto released = store->release_capacity_if_idle();
	ASSERT_TRUE(released);
	EXPECT_EQ(released.value(), 3);

	auto twice = store->release_capacity_if_idle();
	ASSERT_TRUE(twice);
	EXPECT_FALSE(twice.value().has_value());
}

TEST_F(SessionStoreTest, BusySessionKeepsItsSlot) {
	auto store = make_store("s1");
	auto state = initial("s1");
	state.capacity_held = true;
	ASSERT_TRUE(store->create(state));
	ASSERT_EQ(store->increment_active(), 1);

	auto released = store->release_capacity_if_idle();
	ASSERT_TRUE(released);
	EXPECT_FALSE(released.value().has_value());
	EXPECT_TRUE(stored("s1").capacity_held);
}

TEST_F(SessionStoreTest, DroppedClaimCanBeClaimedAgain) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	ASSERT_TRUE(store->claim_capacity(3).value());
	ASSERT_TRUE(store->drop_capacity_claim());
	EXPECT_FALSE(stored("s1").capacity_held);
	EXPECT_TRUE(store->claim_capacity(3).value());
}

// =============================================================================
// Cleanup
// =============================================================================

TEST_F(SessionStoreTest, CleanupRemovesIdleRecordAndReleasesHeldSlot) {
	auto state = initial("s1");
	state.capacity_held = true;
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(state));

	std::vector<long long> released;
	auto res = store->cleanup("worker-a",
							  [&](long long id) { released.push_back(id); });
	ASSERT_TRUE(res);
	EXPECT_TRUE(res.value());
	EXPECT_TRUE(kv_->hash("vodlink:session:s1").empty());
	EXPECT_FALSE(kv_->string_value("vodlink:session:s1:lock").has_value());
	EXPECT_EQ(released, std::vector<long long>{3});
}

TEST_F(SessionStoreTest, CleanupSkipsSlotAlreadyReleased) {
	auto state = initial("s1");
	state.capacity_held = true;
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(state));
	ASSERT_TRUE(store->release_capacity_if_idle().value().has_value());

	int released = 0;
	ASSERT_TRUE(store->cleanup("worker-a", [&](long long) { released++; }));
	EXPECT_EQ(released, 0);
}

TEST_F(SessionStoreTest, CleanupKeepsActiveSession) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));
	ASSERT_EQ(store->increment_active(), 1);

	auto res = store->cleanup("worker-b");
	ASSERT_TRUE(res);
	EXPECT_FALSE(res.value());
	EXPECT_FALSE(kv_->hash("vodlink:session:s1").empty());
}

TEST_F(SessionStoreTest, CleanupRechecksUnderLock) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	// A new stream lands between the lock-free check and the locked re-check
	bool armed = true;
	kv_->before_set_if_absent = [&](std::string_view key) {
		if (!armed || key != "vodlink:session:s1:lock") { return; }
		armed = false;
		auto fields = kv_->hash("vodlink:session:s1");
		fields["active_streams"] = "1";
		kv_->put_hash("vodlink:session:s1", fields);
	};

	auto res = store->cleanup("worker-a");
	ASSERT_TRUE(res);
	EXPECT_FALSE(res.value());
	EXPECT_EQ(stored("s1").active_streams, 1);
}

TEST_F(SessionStoreTest, CleanupOfMissingRecordIsNoop) {
	auto res = make_store("ghost")->cleanup("worker-a");
	ASSERT_TRUE(res);
	EXPECT_FALSE(res.value());
}

// =============================================================================
// Telemetry
// =============================================================================

TEST_F(SessionStoreTest, TouchTransfersOwnershipAndStoresSeek) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	session::TouchUpdate update;
	update.worker_id = "worker-b";
	update.bytes_sent = 819200;
	update.seek = session::SeekInfo{1250, 5000};
	ASSERT_TRUE(store->touch(update));

	auto state = stored("s1");
	EXPECT_EQ(state.worker_id, "worker-b");
	EXPECT_EQ(state.bytes_sent, 819200);
	EXPECT_EQ(state.last_seek_byte, 1250);
	EXPECT_EQ(state.total_content_size, 5000);
	EXPECT_DOUBLE_EQ(state.last_seek_percentage, 25.0);
	EXPECT_GT(state.last_seek_timestamp, 0.0);
}

TEST_F(SessionStoreTest, SessionInfoIsJsonOrEmpty) {
	auto store = make_store("s1");
	ASSERT_TRUE(store->create(initial("s1")));

	auto info = store->session_info();
	ASSERT_TRUE(info);
	ASSERT_TRUE(info.value().has_value());
	EXPECT_EQ((*info.value())["content_id"], "movie-1");

	auto none = make_store("ghost")->session_info();
	ASSERT_TRUE(none);
	EXPECT_FALSE(none.value().has_value());
}

}  // namespace test
}  // namespace vodlink
