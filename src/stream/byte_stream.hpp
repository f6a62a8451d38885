#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vodlink/byte_stream.hpp>
#include <vodlink/upstream.hpp>

namespace vodlink {

// How a ByteStream ended, as reported to its finalizer
enum class StreamEnd : std::uint8_t {
	completed,	// upstream body drained
	stopped,	// checkpoint asked to stop
	cancelled,	// cancel() or destroyed before the end
	failed,		// upstream read error
};

std::string_view to_string(StreamEnd end);

struct ByteStreamOptions {
	std::size_t chunk_size = 8192;
	// Run the checkpoint every this many chunks
	int check_interval = 100;
};

struct ByteStreamHooks {
	// Called with the running byte count; returning false ends the stream
	// after the chunk just delivered.
	std::function<bool(std::uint64_t bytes_sent)> checkpoint;
	// Called exactly once, after the upstream body has been closed
	std::function<void(StreamEnd end, std::uint64_t bytes_sent)> finalize;
};

namespace detail {

struct ByteStreamAccess {
	static ByteStream make(std::unique_ptr<net::UpstreamBody> body,
						   ByteStreamOptions options, ByteStreamHooks hooks);
};

}  // namespace detail

}  // namespace vodlink
