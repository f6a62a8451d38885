#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vodlink/connection_state.hpp>
#include <vodlink/kv_store.hpp>
#include <vodlink/result.hpp>
#include <vodlink/upstream.hpp>

#include "store/distributed_lock.hpp"
#include "store/keys.hpp"
#include "stream/byte_range.hpp"

namespace vodlink::session {

struct SessionStoreOptions {
	store::KeySchema keys;
	std::chrono::seconds session_ttl{3600};
	store::LockOptions lock;
	std::chrono::milliseconds connect_timeout{10000};
	std::chrono::milliseconds read_timeout{10000};
};

/// An opened upstream response together with the record it was opened for.
struct UpstreamHandle {
	net::UpstreamResponse response;
	// Record after this request was accounted (write-once fields filled)
	ConnectionState state;
	// Validated range forwarded upstream, when one could be resolved
	std::optional<stream::ByteRange> range;
};

struct SeekInfo {
	long long byte = 0;
	long long total = 0;
};

/// Lock-protected partial update applied by SessionStore::touch().
/// last_activity is always refreshed.
struct TouchUpdate {
	std::optional<std::string> worker_id;
	std::optional<long long> bytes_sent;
	std::optional<SeekInfo> seek;
};

// Called with the profile id whose counter should be decremented
using CapacityRelease = std::function<void(long long profile_id)>;

/// Handle on one session record and its lock.
///
/// Every read-modify-write goes through the session's DistributedLock.
/// fetch() and has_active_streams() are lock-free and only advisory. The
/// handle itself holds no upstream resources; the body returned by
/// open_upstream() is owned by the caller.
class SessionStore {
   public:
	SessionStore(std::string session_id,
				 std::shared_ptr<store::KeyValueStore> kv,
				 std::shared_ptr<net::UpstreamClient> upstream,
				 SessionStoreOptions options = {});

	[[nodiscard]] const std::string &session_id() const { return session_id_; }

	/// Write the record unless one already exists. Returns true when this
	/// call created it.
	Result<bool> create(const ConnectionState &initial);

	Result<std::optional<ConnectionState>> fetch();

	/// GET the content from the provider, accounting the request in the
	/// record. A range that cannot be satisfied against a known length fails
	/// with range_not_satisfiable before any connection is made.
	Result<UpstreamHandle> open_upstream(
		const std::optional<std::string> &range_header);

	/// New active stream count, or 0 when the record is gone or the lock
	/// could not be taken.
	int increment_active();

	/// False when the count was already 0, the record is missing, or the lock
	/// could not be taken.
	bool decrement_active();

	bool has_active_streams();

	/// Mark the session as holding a slot of `profile_id`. Returns true when
	/// the flag was clear, meaning the caller must now reserve one.
	Result<bool> claim_capacity(long long profile_id);

	/// Undo a claim_capacity() whose reservation failed.
	Result<void> drop_capacity_claim();

	/// If the session is idle and holds a slot, clear the flag and return the
	/// profile id to release. Exactly one caller sees the id per claim.
	Result<std::optional<long long>> release_capacity_if_idle();

	/// Delete the record if it is idle, re-checking under the lock. Returns
	/// true when this call deleted it. `release`, when given, is invoked for
	/// a slot the record still held.
	Result<bool> cleanup(std::string_view owner_worker_id,
						 const CapacityRelease &release = {});

	Result<void> touch(const TouchUpdate &update);

	/// Metadata view for operator tooling; nullopt when the record is absent.
	Result<std::optional<nlohmann::json>> session_info();

   private:
	using Mutation = std::function<bool(ConnectionState &)>;

	// Lock, read, apply, write back when `fn` returns true. Yields the record
	// as left by `fn`, or nullopt when there is no record.
	Result<std::optional<ConnectionState>> update(std::string_view op,
												  const Mutation &fn);

	Result<void> save(const ConnectionState &state);

	std::string session_id_;
	std::shared_ptr<store::KeyValueStore> kv_;
	std::shared_ptr<net::UpstreamClient> upstream_;
	SessionStoreOptions options_;
	std::string record_key_;
	std::string lock_key_;
};

}  // namespace vodlink::session
