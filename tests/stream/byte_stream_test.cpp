// vodlink - Tests for ByteStream
//
// Tests cover:
// - Chunked delivery and byte accounting
// - Finalizer runs exactly once for every way a stream can end
// - Checkpoint cadence and stop requests
// - Cancellation and move semantics

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "stream/byte_stream.hpp"
#include "support/memory_store.hpp"

namespace vodlink {
namespace test {

class ByteStreamTest : public ::testing::Test {
   protected:
	ByteStream make(std::string data, ByteStreamOptions options = {},
					std::optional<std::size_t> fail_after = std::nullopt) {
		ByteStreamHooks hooks;
		hooks.checkpoint = [this](std::uint64_t bytes) {
			checkpoints_.push_back(bytes);
			return keep_going_;
		};
		hooks.finalize = [this](StreamEnd end, std::uint64_t bytes) {
			ends_.push_back(end);
			final_bytes_ = bytes;
		};
		return detail::ByteStreamAccess::make(
			std::make_unique<FakeBody>(std::move(data), 4096, fail_after),
			options, std::move(hooks));
	}

	// Read until end, error or cancellation
	std::string drain(ByteStream &stream) {
		std::string out;
		while (true) {
			auto chunk = stream.read();
			if (!chunk || chunk.value().empty()) { break; }
			out.append(chunk.value().begin(), chunk.value().end());
		}
		return out;
	}

	std::vector<std::uint64_t> checkpoints_;
	std::vector<StreamEnd> ends_;
	std::uint64_t final_bytes_ = 0;
	bool keep_going_ = true;
};

// =============================================================================
// Delivery
// =============================================================================

TEST_F(ByteStreamTest, DeliversWholeBodyInChunks) {
	const std::string data(10000, 'x');
	ByteStreamOptions options;
	options.chunk_size = 1024;
	auto stream = make(data, options);

	auto first = stream.read();
	ASSERT_TRUE(first);
	EXPECT_EQ(first.value().size(), 1024u);

	auto rest = drain(stream);
	EXPECT_EQ(rest.size(), data.size() - 1024);
	EXPECT_TRUE(stream.is_eof());
	EXPECT_EQ(stream.bytes_sent(), data.size());

	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::completed);
	EXPECT_EQ(final_bytes_, data.size());

	// Reads after the end keep returning an empty chunk
	auto after = stream.read();
	ASSERT_TRUE(after);
	EXPECT_TRUE(after.value().empty());
	EXPECT_EQ(ends_.size(), 1u);
}

TEST_F(ByteStreamTest, NothingIsReadUntilAsked) {
	auto stream = make("abc");
	EXPECT_EQ(stream.bytes_sent(), 0u);
	EXPECT_TRUE(ends_.empty());
}

TEST_F(ByteStreamTest, ZeroChunkSizeFallsBackToDefault) {
	ByteStreamOptions options;
	options.chunk_size = 0;
	auto stream = make(std::string(5000, 'y'), options);
	auto chunk = stream.read();
	ASSERT_TRUE(chunk);
	EXPECT_EQ(chunk.value().size(), 4096u);	 // body hands out 4096 at most
}

// =============================================================================
// Termination
// =============================================================================

TEST_F(ByteStreamTest, ReadErrorFinalizesAsFailed) {
	ByteStreamOptions options;
	options.chunk_size = 100;
	auto stream = make(std::string(1000, 'z'), options, 250);

	std::string out;
	Result<std::vector<std::uint8_t>> chunk = std::vector<std::uint8_t>{};
	do {
		chunk = stream.read();
		if (chunk) { out.append(chunk.value().begin(), chunk.value().end()); }
	} while (chunk && !chunk.value().empty());

	EXPECT_FALSE(chunk);
	EXPECT_EQ(out.size(), 250u);
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::failed);
}

TEST_F(ByteStreamTest, CancelStopsAtNextRead) {
	auto stream = make(std::string(10000, 'c'));
	ASSERT_TRUE(stream.read());
	stream.cancel();
	EXPECT_TRUE(stream.is_cancelled());

	auto chunk = stream.read();
	ASSERT_FALSE(chunk);
	EXPECT_EQ(chunk.error(), errc::stream_cancelled);
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::cancelled);

	// A second read does not finalize again
	EXPECT_FALSE(stream.read());
	EXPECT_EQ(ends_.size(), 1u);
}

TEST_F(ByteStreamTest, DestroyingUnfinishedStreamFinalizes) {
	{
		auto stream = make(std::string(10000, 'd'));
		ASSERT_TRUE(stream.read());
	}
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::cancelled);
	EXPECT_EQ(final_bytes_, 4096u);
}

TEST_F(ByteStreamTest, DestroyingNeverReadStreamFinalizes) {
	{ auto stream = make("never read"); }
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::cancelled);
	EXPECT_EQ(final_bytes_, 0u);
}

TEST_F(ByteStreamTest, DestroyingDrainedStreamDoesNotFinalizeAgain) {
	{
		auto stream = make("short");
		drain(stream);
	}
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::completed);
}

TEST_F(ByteStreamTest, MovedFromStreamIsInert) {
	auto a = make(std::string(100, 'm'));
	ByteStream b = std::move(a);
	EXPECT_EQ(drain(b).size(), 100u);
	EXPECT_EQ(ends_.size(), 1u);
}

// =============================================================================
// Checkpoints
// =============================================================================

TEST_F(ByteStreamTest, CheckpointRunsEveryInterval) {
	ByteStreamOptions options;
	options.chunk_size = 10;
	options.check_interval = 3;
	auto stream = make(std::string(100, 'k'), options);

	drain(stream);
	// 10 chunks -> checkpoints after chunks 3, 6 and 9
	EXPECT_EQ(checkpoints_, (std::vector<std::uint64_t>{30, 60, 90}));
}

TEST_F(ByteStreamTest, CheckpointCanStopTheStream) {
	ByteStreamOptions options;
	options.chunk_size = 10;
	options.check_interval = 2;
	keep_going_ = false;
	auto stream = make(std::string(100, 's'), options);

	auto out = drain(stream);
	// The chunk that triggered the checkpoint is still delivered
	EXPECT_EQ(out.size(), 20u);
	EXPECT_TRUE(stream.is_eof());
	ASSERT_EQ(ends_.size(), 1u);
	EXPECT_EQ(ends_[0], StreamEnd::stopped);
	EXPECT_EQ(final_bytes_, 20u);
}

TEST_F(ByteStreamTest, ThrowingFinalizerIsContained) {
	ByteStreamHooks hooks;
	int calls = 0;
	hooks.finalize = [&calls](StreamEnd, std::uint64_t) {
		calls++;
		throw std::runtime_error("boom");
	};
	{
		auto stream = detail::ByteStreamAccess::make(
			std::make_unique<FakeBody>("abc"), {}, std::move(hooks));
		drain(stream);
	}
	EXPECT_EQ(calls, 1);
}

}  // namespace test
}  // namespace vodlink
