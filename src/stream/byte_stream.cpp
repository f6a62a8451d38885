#include "stream/byte_stream.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>

namespace vodlink {

std::string_view to_string(StreamEnd end) {
	switch (end) {
		case StreamEnd::completed: return "completed";
		case StreamEnd::stopped: return "stopped";
		case StreamEnd::cancelled: return "cancelled";
		case StreamEnd::failed: return "failed";
	}
	return "unknown";
}

struct ByteStream::Impl {
	std::unique_ptr<net::UpstreamBody> body;
	ByteStreamOptions options;
	ByteStreamHooks hooks;

	std::atomic<bool> cancelled{false};
	std::atomic<bool> eof{false};
	std::atomic<std::uint64_t> bytes{0};
	std::uint64_t chunks = 0;
	bool stop_requested = false;

	std::mutex read_mutex;
	std::once_flag finish_once;

	~Impl() { finish(StreamEnd::cancelled); }

	void finish(StreamEnd end) {
		std::call_once(finish_once, [this, end] {
			// Close the provider connection before the bookkeeping runs
			body.reset();
			spdlog::debug("Byte stream {} after {} bytes", to_string(end),
						  bytes.load());
			if (!hooks.finalize) { return; }
			try {
				hooks.finalize(end, bytes.load());
			} catch (const std::exception &e) {
				spdlog::error("Stream finalizer failed: {}", e.what());
			}
		});
	}

	Result<std::vector<std::uint8_t>> read() {
		std::lock_guard lock(read_mutex);

		if (cancelled.load()) {
			finish(StreamEnd::cancelled);
			return make_error_code(errc::stream_cancelled);
		}
		if (eof.load()) { return std::vector<std::uint8_t>{}; }
		if (stop_requested || !body) {
			eof.store(true);
			finish(StreamEnd::stopped);
			return std::vector<std::uint8_t>{};
		}

		std::vector<std::uint8_t> chunk(options.chunk_size);
		auto n = body->read(reinterpret_cast<char *>(chunk.data()),
							chunk.size());
		if (!n) {
			spdlog::error("Upstream read failed after {} bytes: {}",
						  bytes.load(), n.error().message());
			eof.store(true);
			finish(StreamEnd::failed);
			return n.error();
		}
		if (n.value() == 0) {
			eof.store(true);
			finish(StreamEnd::completed);
			return std::vector<std::uint8_t>{};
		}

		chunk.resize(n.value());
		bytes += n.value();
		chunks++;

		if (hooks.checkpoint && options.check_interval > 0 &&
			chunks % static_cast<std::uint64_t>(options.check_interval) == 0) {
			try {
				stop_requested = !hooks.checkpoint(bytes.load());
			} catch (const std::exception &e) {
				spdlog::warn("Stream checkpoint failed: {}", e.what());
			}
		}
		return chunk;
	}
};

ByteStream::ByteStream(std::shared_ptr<Impl> impl) : m_impl(std::move(impl)) {}
ByteStream::ByteStream(ByteStream &&) noexcept = default;
ByteStream &ByteStream::operator=(ByteStream &&) noexcept = default;
ByteStream::~ByteStream() = default;

Result<std::vector<std::uint8_t>> ByteStream::read() {
	if (!m_impl) { return make_error_code(errc::stream_cancelled); }
	return m_impl->read();
}

bool ByteStream::is_eof() const { return m_impl && m_impl->eof.load(); }

bool ByteStream::is_cancelled() const {
	return m_impl && m_impl->cancelled.load();
}

void ByteStream::cancel() {
	if (m_impl) { m_impl->cancelled.store(true); }
}

std::uint64_t ByteStream::bytes_sent() const {
	return m_impl ? m_impl->bytes.load() : 0;
}

namespace detail {

ByteStream ByteStreamAccess::make(std::unique_ptr<net::UpstreamBody> body,
								  ByteStreamOptions options,
								  ByteStreamHooks hooks) {
	auto impl = std::make_shared<ByteStream::Impl>();
	impl->body = std::move(body);
	impl->options = options;
	if (impl->options.chunk_size == 0) { impl->options.chunk_size = 8192; }
	impl->hooks = std::move(hooks);
	return ByteStream(std::move(impl));
}

}  // namespace detail

}  // namespace vodlink
