#pragma once

#include <vodlink/vodlink_export.h>

#include <cstdint>
#include <memory>
#include <vector>
#include <vodlink/result.hpp>

namespace vodlink {

namespace detail {
struct ByteStreamAccess;
}  // namespace detail

/// ByteStream - the body of a 200/206 response, pulled chunk by chunk.
///
/// Reading is lazy: nothing is fetched from the provider until read() is
/// called. Whatever way the stream ends (drained, stopped by an operator,
/// cancelled, failed, or simply destroyed), the session bookkeeping attached
/// to it runs exactly once.
///
///   while (true) {
///       auto chunk = stream.read();
///       if (!chunk || chunk.value().empty()) break;
///       socket.write(chunk.value());
///   }
class VODLINK_EXPORT ByteStream {
   public:
	ByteStream(ByteStream &&) noexcept;
	ByteStream &operator=(ByteStream &&) noexcept;
	~ByteStream();

	// Non-copyable
	ByteStream(const ByteStream &) = delete;
	ByteStream &operator=(const ByteStream &) = delete;

	/// Next chunk of at most the configured chunk size.
	/// Returns an empty vector at the end of the stream, stream_cancelled
	/// after cancel(), or the upstream read error.
	Result<std::vector<std::uint8_t>> read();

	/// Check if the stream has ended normally
	[[nodiscard]] bool is_eof() const;

	/// Check if the stream was cancelled
	[[nodiscard]] bool is_cancelled() const;

	/// Cancel the stream (thread-safe). Takes effect at the next read() or
	/// on destruction.
	void cancel();

	[[nodiscard]] std::uint64_t bytes_sent() const;

   private:
	friend struct detail::ByteStreamAccess;

	struct Impl;
	explicit ByteStream(std::shared_ptr<Impl> impl);

	std::shared_ptr<Impl> m_impl;
};

}  // namespace vodlink
