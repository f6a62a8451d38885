#pragma once

#include <memory>
#include <string>
#include <vodlink/upstream.hpp>

namespace vodlink::net {

/// Boost.Beast implementation of UpstreamClient for http:// and https://.
///
/// Each open() drives its own io_context so the calling thread blocks while
/// socket operations still honour the connect/read deadlines. TLS peers are
/// verified against the system trust store.
class HttpClient final : public UpstreamClient {
   public:
	explicit HttpClient(std::string user_agent = "vodlink/1.0");
	~HttpClient() override;

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;

	Result<UpstreamResponse> open(const UpstreamRequest &request) override;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace vodlink::net
