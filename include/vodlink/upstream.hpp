#pragma once

#include <vodlink/vodlink_export.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vodlink/result.hpp>

namespace vodlink::net {

struct VODLINK_EXPORT UpstreamRequest {
	std::string url;
	std::map<std::string, std::string> headers;
	bool follow_redirects = true;
	std::chrono::milliseconds connect_timeout{10000};
	std::chrono::milliseconds read_timeout{10000};
};

/// Blocking reader over a response body. Closing happens on destruction.
class VODLINK_EXPORT UpstreamBody {
   public:
	virtual ~UpstreamBody() = default;

	/// Read up to `size` bytes into `data`. Returns 0 at end of body.
	virtual Result<std::size_t> read(char *data, std::size_t size) = 0;
};

struct VODLINK_EXPORT UpstreamResponse {
	int status_code = 0;
	// Header names are lower-cased
	std::map<std::string, std::string> headers;
	// URL that produced this response, after any redirects
	std::string final_url;
	std::unique_ptr<UpstreamBody> body;
};

/// Opens GET requests against provider servers.
///
/// open() returns once the response head has arrived; the body is then
/// pulled through UpstreamResponse::body. Connection failures and timeouts
/// yield upstream_failed, a final status outside 2xx/3xx yields
/// upstream_http_error.
class VODLINK_EXPORT UpstreamClient {
   public:
	virtual ~UpstreamClient() = default;

	virtual Result<UpstreamResponse> open(const UpstreamRequest &request) = 0;
};

}  // namespace vodlink::net
