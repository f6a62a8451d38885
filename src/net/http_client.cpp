#include "net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace vodlink::net {

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

constexpr int kMaxRedirects = 5;

// =============================================================================
// DNS CACHE
// =============================================================================
// Provider hosts are few and hit on every play/seek request, so resolution
// results are kept for a few minutes.
// =============================================================================

struct DnsCacheEntry {
	tcp::resolver::results_type results;
	std::chrono::steady_clock::time_point expires_at;
};

class DnsCache {
   public:
	static constexpr auto kDefaultTTL = std::chrono::minutes(5);
	static constexpr size_t kMaxCacheSize = 64;

	std::optional<tcp::resolver::results_type> get(const std::string &host,
												   const std::string &port) {
		std::lock_guard lock(mutex_);
		auto it = cache_.find(host + ":" + port);
		if (it == cache_.end()) { return std::nullopt; }
		if (std::chrono::steady_clock::now() > it->second.expires_at) {
			cache_.erase(it);
			return std::nullopt;
		}
		return it->second.results;
	}

	void put(const std::string &host, const std::string &port,
			 const tcp::resolver::results_type &results) {
		std::lock_guard lock(mutex_);
		if (cache_.size() >= kMaxCacheSize) { evict_expired(); }
		if (cache_.size() >= kMaxCacheSize) {
			auto oldest = cache_.begin();
			for (auto it = cache_.begin(); it != cache_.end(); ++it) {
				if (it->second.expires_at < oldest->second.expires_at) {
					oldest = it;
				}
			}
			cache_.erase(oldest);
		}
		cache_[host + ":" + port] = DnsCacheEntry{
			results, std::chrono::steady_clock::now() + kDefaultTTL};
	}

	// Dropped after a failed connect so the next attempt re-resolves
	void invalidate(const std::string &host, const std::string &port) {
		std::lock_guard lock(mutex_);
		cache_.erase(host + ":" + port);
	}

   private:
	void evict_expired() {
		auto now = std::chrono::steady_clock::now();
		for (auto it = cache_.begin(); it != cache_.end();) {
			if (now > it->second.expires_at) {
				it = cache_.erase(it);
			} else {
				++it;
			}
		}
	}

	std::mutex mutex_;
	std::unordered_map<std::string, DnsCacheEntry> cache_;
};

DnsCache &get_dns_cache() {
	static DnsCache instance;
	return instance;
}

// =============================================================================
// Helpers
// =============================================================================

struct Target {
	bool tls = false;
	std::string host;
	std::string port;
	std::string host_header;
	std::string path;  // origin-form request target
};

Result<Target> parse_target(std::string_view url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) { return make_error_code(errc::invalid_url); }
	boost::urls::url_view u = u_res.value();

	Target t;
	if (u.scheme_id() == boost::urls::scheme::https) {
		t.tls = true;
	} else if (u.scheme_id() != boost::urls::scheme::http) {
		return make_error_code(errc::invalid_url);
	}

	t.host = u.host_address();
	if (t.host.empty()) { return make_error_code(errc::invalid_url); }
	t.port = u.port();
	if (t.port.empty()) { t.port = t.tls ? "443" : "80"; }
	t.host_header = u.encoded_host_and_port();

	t.path = u.encoded_path();
	if (t.path.empty()) { t.path = "/"; }
	if (u.has_query()) {
		t.path += "?";
		t.path += u.encoded_query();
	}
	return t;
}

Result<std::string> resolve_location(std::string_view base,
									 std::string_view location) {
	auto b = boost::urls::parse_uri(base);
	auto ref = boost::urls::parse_uri_reference(location);
	if (b.has_error() || ref.has_error()) {
		return make_error_code(errc::invalid_url);
	}
	boost::urls::url next(b.value());
	if (next.resolve(ref.value()).has_error()) {
		return make_error_code(errc::invalid_url);
	}
	return std::string(next.buffer());
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

// Run one async operation to completion on a private io_context. Deadlines
// are enforced by the tcp_stream timer, which only applies to async ops.
template <typename Initiate>
beast::error_code run_blocking(asio::io_context &ioc, Initiate &&initiate) {
	beast::error_code result = asio::error::would_block;
	initiate([&result](beast::error_code ec, auto &&...) { result = ec; });
	ioc.restart();
	ioc.run();
	return result;
}

// =============================================================================
// Response body
// =============================================================================

template <typename Stream>
class BeastUpstreamBody final : public UpstreamBody {
   public:
	BeastUpstreamBody(
		std::unique_ptr<asio::io_context> ioc, std::unique_ptr<Stream> stream,
		std::unique_ptr<beast::flat_buffer> buffer,
		std::unique_ptr<http::response_parser<http::buffer_body>> parser,
		std::chrono::milliseconds read_timeout)
		: ioc_(std::move(ioc)),
		  stream_(std::move(stream)),
		  buffer_(std::move(buffer)),
		  parser_(std::move(parser)),
		  read_timeout_(read_timeout) {}

	~BeastUpstreamBody() override {
		// No TLS close_notify; the provider sees a plain disconnect
		beast::error_code ec;
		beast::get_lowest_layer(*stream_).socket().close(ec);
	}

	Result<std::size_t> read(char *data, std::size_t size) override {
		// The parser may consume framing (chunk headers) without yielding
		// body bytes, so keep going until data arrives or the body ends.
		while (!parser_->is_done()) {
			parser_->get().body().data = data;
			parser_->get().body().size = size;

			beast::get_lowest_layer(*stream_).expires_after(read_timeout_);
			auto ec = run_blocking(*ioc_, [this](auto handler) {
				http::async_read_some(
					*stream_, *buffer_, *parser_, std::move(handler));
			});
			if (ec == http::error::need_buffer) { ec = {}; }
			if (ec) {
				spdlog::warn("Upstream body read failed: {}", ec.message());
				return make_error_code(errc::upstream_failed);
			}

			auto n = size - parser_->get().body().size;
			if (n > 0) { return n; }
		}
		return std::size_t{0};
	}

   private:
	std::unique_ptr<asio::io_context> ioc_;
	std::unique_ptr<Stream> stream_;
	std::unique_ptr<beast::flat_buffer> buffer_;
	std::unique_ptr<http::response_parser<http::buffer_body>> parser_;
	std::chrono::milliseconds read_timeout_;
};

}  // namespace

// =============================================================================
// HttpClient
// =============================================================================

struct HttpClient::Impl {
	std::string user_agent;
	ssl::context ssl_ctx;

	explicit Impl(std::string ua)
		: user_agent(std::move(ua)), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	Result<tcp::resolver::results_type> resolve(asio::io_context &ioc,
												const Target &t) {
		if (auto cached = get_dns_cache().get(t.host, t.port)) {
			return *cached;
		}
		boost::system::error_code ec;
		tcp::resolver resolver(ioc);
		auto results = resolver.resolve(t.host, t.port, ec);
		if (ec) {
			spdlog::warn("Failed to resolve {}: {}", t.host, ec.message());
			return make_error_code(errc::upstream_failed);
		}
		get_dns_cache().put(t.host, t.port, results);
		return results;
	}

	// One request/response-head exchange, no redirect handling
	template <typename Stream>
	Result<UpstreamResponse> fetch(const Target &t,
								   const UpstreamRequest &request) {
		auto ioc = std::make_unique<asio::io_context>();

		auto results = resolve(*ioc, t);
		if (!results) { return results.error(); }

		std::unique_ptr<Stream> stream;
		if constexpr (std::is_same_v<Stream, TlsStream>) {
			stream = std::make_unique<Stream>(*ioc, ssl_ctx);
			boost::certify::set_server_hostname(*stream, t.host);
		} else {
			stream = std::make_unique<Stream>(*ioc);
		}
		auto &socket = beast::get_lowest_layer(*stream);

		socket.expires_after(request.connect_timeout);
		auto ec = run_blocking(*ioc, [&](auto handler) {
			socket.async_connect(results.value(), std::move(handler));
		});
		if (ec) {
			get_dns_cache().invalidate(t.host, t.port);
			spdlog::warn("Connect to {}:{} failed: {}", t.host, t.port,
						 ec.message());
			return make_error_code(errc::upstream_failed);
		}

		if constexpr (std::is_same_v<Stream, TlsStream>) {
			socket.expires_after(request.connect_timeout);
			ec = run_blocking(*ioc, [&](auto handler) {
				stream->async_handshake(
					ssl::stream_base::client, std::move(handler));
			});
			if (ec) {
				spdlog::warn(
					"TLS handshake with {} failed: {}", t.host, ec.message());
				return make_error_code(errc::upstream_failed);
			}
		}

		http::request<http::empty_body> req{http::verb::get, t.path, 11};
		req.set(http::field::host, t.host_header);
		req.set(http::field::user_agent, user_agent);
		req.set(http::field::accept, "*/*");
		for (const auto &[key, value] : request.headers) {
			req.set(key, value);
		}

		socket.expires_after(request.read_timeout);
		ec = run_blocking(*ioc, [&](auto handler) {
			http::async_write(*stream, req, std::move(handler));
		});
		if (ec) {
			spdlog::warn("Request write to {} failed: {}", t.host,
						 ec.message());
			return make_error_code(errc::upstream_failed);
		}

		auto buffer = std::make_unique<beast::flat_buffer>();
		auto parser =
			std::make_unique<http::response_parser<http::buffer_body>>();
		parser->body_limit(boost::none);

		socket.expires_after(request.read_timeout);
		ec = run_blocking(*ioc, [&](auto handler) {
			http::async_read_header(
				*stream, *buffer, *parser, std::move(handler));
		});
		if (ec) {
			spdlog::warn("Response header from {} failed: {}", t.host,
						 ec.message());
			return make_error_code(errc::upstream_failed);
		}

		UpstreamResponse out;
		out.status_code = static_cast<int>(parser->get().result_int());
		for (const auto &field : parser->get()) {
			out.headers[boost::algorithm::to_lower_copy(
				std::string(field.name_string()))] =
				std::string(field.value());
		}
		out.body = std::make_unique<BeastUpstreamBody<Stream>>(
			std::move(ioc), std::move(stream), std::move(buffer),
			std::move(parser), request.read_timeout);
		return out;
	}

	Result<UpstreamResponse> open(const UpstreamRequest &request) {
		std::string url = request.url;

		for (int hop = 0;; ++hop) {
			auto target = parse_target(url);
			if (!target) {
				spdlog::warn("Rejecting upstream URL {}", url);
				return target.error();
			}

			auto res = target.value().tls
						   ? fetch<TlsStream>(target.value(), request)
						   : fetch<PlainStream>(target.value(), request);
			if (!res) { return res.error(); }

			auto &response = res.value();
			if (request.follow_redirects && is_redirect(response.status_code)) {
				auto location = response.headers.find("location");
				if (location == response.headers.end()) {
					spdlog::warn("Redirect from {} without Location", url);
					return make_error_code(errc::upstream_http_error);
				}
				if (hop >= kMaxRedirects) {
					spdlog::warn("Too many redirects starting at {}",
								 request.url);
					return make_error_code(errc::too_many_redirects);
				}
				auto next = resolve_location(url, location->second);
				if (!next) { return next.error(); }
				spdlog::debug("Redirect {} -> {}", url, next.value());
				url = std::move(next.value());
				continue;
			}

			if (response.status_code < 200 || response.status_code >= 400) {
				spdlog::warn(
					"Upstream returned HTTP {} for {}", response.status_code,
					url);
				return make_error_code(errc::upstream_http_error);
			}

			response.final_url = url;
			return std::move(response);
		}
	}
};

HttpClient::HttpClient(std::string user_agent)
	: m_impl(std::make_unique<Impl>(std::move(user_agent))) {}

HttpClient::~HttpClient() = default;

Result<UpstreamResponse> HttpClient::open(const UpstreamRequest &request) {
	try {
		return m_impl->open(request);
	} catch (const std::exception &e) {
		spdlog::error("Upstream request exception: {}", e.what());
		return make_error_code(errc::upstream_failed);
	}
}

}  // namespace vodlink::net
