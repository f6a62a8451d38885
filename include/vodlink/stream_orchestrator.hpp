#pragma once

#include <vodlink/vodlink_export.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vodlink/byte_stream.hpp>
#include <vodlink/config.hpp>
#include <vodlink/kv_store.hpp>
#include <vodlink/task_scheduler.hpp>
#include <vodlink/types.hpp>
#include <vodlink/upstream.hpp>

namespace vodlink {

/// What the HTTP layer should send back for one play/seek request.
struct VODLINK_EXPORT StreamResponse {
	int status = 500;
	std::map<std::string, std::string> headers;
	// Plain-text reason for 4xx/5xx responses
	std::string body;
	// Set for 200/206 only
	std::optional<ByteStream> stream;
	// Session the request was served under (reused or new)
	std::string session_id;
};

/// StreamOrchestrator - serves VOD play/seek requests on top of the shared
/// session records.
///
/// One instance per process, shared by all request threads. A request either
/// reuses an idle session for the same content and client, or creates one
/// after reserving a provider connection slot. The returned ByteStream
/// carries the teardown: when it ends, the stream count is released, an idle
/// session gives its slot back immediately and its record is removed after
/// Config::cleanup_delay unless another stream picked it up meanwhile.
///
/// stream() never throws; every failure maps to a 4xx/5xx response with
/// any state taken for the request rolled back.
class VODLINK_EXPORT StreamOrchestrator {
   public:
	StreamOrchestrator(std::shared_ptr<store::KeyValueStore> kv,
					   std::shared_ptr<net::UpstreamClient> upstream,
					   std::shared_ptr<TaskScheduler> scheduler,
					   Config config = {});
	~StreamOrchestrator();

	StreamOrchestrator(const StreamOrchestrator &) = delete;
	StreamOrchestrator &operator=(const StreamOrchestrator &) = delete;

	StreamResponse stream(const StreamRequest &request);

	[[nodiscard]] const std::string &worker_id() const;

   private:
	struct Impl;
	std::shared_ptr<Impl> m_impl;
};

}  // namespace vodlink
