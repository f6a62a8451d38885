#include "session/session_store.hpp"

#include <spdlog/spdlog.h>

#include "stream/content_type.hpp"
#include "utils.hpp"

namespace vodlink::session {

SessionStore::SessionStore(std::string session_id,
						   std::shared_ptr<store::KeyValueStore> kv,
						   std::shared_ptr<net::UpstreamClient> upstream,
						   SessionStoreOptions options)
	: session_id_(std::move(session_id)),
	  kv_(std::move(kv)),
	  upstream_(std::move(upstream)),
	  options_(std::move(options)),
	  record_key_(options_.keys.session(session_id_)),
	  lock_key_(options_.keys.session_lock(session_id_)) {}

// =============================================================================
// Record access
// =============================================================================

Result<std::optional<ConnectionState>> SessionStore::fetch() {
	auto fields = kv_->hash_get_all(record_key_);
	if (!fields) { return fields.error(); }
	if (fields.value().empty()) { return std::optional<ConnectionState>{}; }

	auto state = from_hash(fields.value());
	if (!state) {
		spdlog::error("[{}] Unreadable session record", session_id_);
		return state.error();
	}
	return std::optional<ConnectionState>(std::move(state.value()));
}

Result<void> SessionStore::save(const ConnectionState &state) {
	return kv_->hash_set(record_key_, to_hash(state), options_.session_ttl);
}

Result<std::optional<ConnectionState>> SessionStore::update(
	std::string_view op, const Mutation &fn) {
	store::DistributedLock lock(kv_, lock_key_, options_.lock);
	if (auto acquired = lock.acquire(); !acquired) {
		spdlog::warn("[{}] {} failed: could not acquire lock", session_id_, op);
		return acquired.error();
	}

	auto current = fetch();
	if (!current) { return current.error(); }
	if (!current.value()) { return current; }

	auto &state = *current.value();
	if (fn(state)) {
		if (auto saved = save(state); !saved) { return saved.error(); }
	}
	return current;
}

Result<bool> SessionStore::create(const ConnectionState &initial) {
	store::DistributedLock lock(kv_, lock_key_, options_.lock);
	if (auto acquired = lock.acquire(); !acquired) {
		spdlog::warn(
			"[{}] Could not acquire lock for session creation", session_id_);
		return acquired.error();
	}

	auto exists = kv_->exists(record_key_);
	if (!exists) { return exists.error(); }
	if (exists.value()) {
		spdlog::info("[{}] Session record already exists", session_id_);
		return false;
	}

	auto state = initial;
	state.session_id = session_id_;
	auto now = utils::now_seconds();
	if (state.created_at == 0.0) { state.created_at = now; }
	if (state.last_activity == 0.0) { state.last_activity = now; }

	if (auto saved = save(state); !saved) { return saved.error(); }
	spdlog::info("[{}] Created session record for {} {}", session_id_,
				 to_string(state.content_kind), state.content_name);
	return true;
}

// =============================================================================
// Upstream
// =============================================================================

Result<UpstreamHandle> SessionStore::open_upstream(
	const std::optional<std::string> &range_header) {
	auto current = fetch();
	if (!current) { return current.error(); }
	if (!current.value()) {
		spdlog::error("[{}] No session record found", session_id_);
		return make_error_code(errc::session_not_found);
	}
	const auto &state = *current.value();

	net::UpstreamRequest request;
	request.headers = state.request_headers;
	request.url = state.target_url();
	// Redirects were resolved on the first request
	request.follow_redirects = state.final_url.empty();
	request.connect_timeout = options_.connect_timeout;
	request.read_timeout = options_.read_timeout;

	std::optional<stream::ByteRange> range;
	if (range_header) {
		auto forwarded = *range_header;
		if (state.content_length) {
			if (auto spec = stream::parse_range_header(*range_header)) {
				auto resolved =
					stream::resolve_range(*spec, *state.content_length);
				if (!resolved) {
					spdlog::warn("[{}] Range not satisfiable: {}", session_id_,
								 *range_header);
					return resolved.error();
				}
				range = resolved.value();
				forwarded = stream::to_range_header(*range);
			}
		}
		request.headers["Range"] = forwarded;
		spdlog::info("[{}] Setting Range header: {}", session_id_, forwarded);
	}

	if (!upstream_) {
		spdlog::error("[{}] No upstream client configured", session_id_);
		return make_error_code(errc::upstream_failed);
	}

	spdlog::info("[{}] Making request #{} to {} URL", session_id_,
				 state.request_count + 1,
				 state.final_url.empty() ? "original" : "final");

	auto response = upstream_->open(request);
	if (!response) {
		spdlog::error("[{}] Error establishing connection: {}", session_id_,
					  response.error().message());
		return response.error();
	}
	auto &resp = response.value();

	// Descriptor fields learned from this response; only empty ones are
	// filled in the stored record.
	std::optional<long long> length;
	if (auto cr = resp.headers.find("content-range");
		cr != resp.headers.end()) {
		length = stream::content_range_total(cr->second);
	}
	if (!length) {
		if (auto cl = resp.headers.find("content-length");
			cl != resp.headers.end()) {
			if (auto parsed = utils::to_long(cl->second)) {
				length = parsed.value();
			}
		}
	}

	std::string content_type;
	if (auto ct = resp.headers.find("content-type");
		ct != resp.headers.end() && !ct->second.empty()) {
		content_type = ct->second;
	} else if (auto inferred = stream::content_type_from_url(state.stream_url)) {
		spdlog::info("[{}] Provider missing Content-Type, inferred {}",
					 session_id_, *inferred);
		content_type = std::string(*inferred);
	} else {
		content_type = std::string(stream::kDefaultContentType);
	}

	const auto now = utils::now_seconds();
	auto apply = [&](ConnectionState &s) {
		s.request_count += 1;
		s.last_activity = now;
		if (!s.content_length && length) { s.content_length = length; }
		if (s.content_type.empty()) { s.content_type = content_type; }
		if (s.final_url.empty()) { s.final_url = resp.final_url; }
		return true;
	};

	UpstreamHandle handle;
	auto saved = update("open_upstream", apply);
	if (saved && saved.value()) {
		handle.state = std::move(*saved.value());
	} else {
		// Stream anyway; the record catches up on the next request
		spdlog::warn("[{}] Could not persist upstream details", session_id_);
		handle.state = state;
		apply(handle.state);
	}

	spdlog::info("[{}] Upstream ready: status={} length={} type={}",
				 session_id_, resp.status_code,
				 handle.state.content_length ? *handle.state.content_length : -1,
				 handle.state.content_type);

	// A range passed through unresolved can be resolved now the length is
	// known, so response headers can still report it.
	if (!range && range_header && handle.state.content_length) {
		if (auto spec = stream::parse_range_header(*range_header)) {
			if (auto resolved =
					stream::resolve_range(*spec, *handle.state.content_length)) {
				range = resolved.value();
			}
		}
	}

	handle.response = std::move(resp);
	handle.range = range;
	return handle;
}

// =============================================================================
// Reference counting
// =============================================================================

int SessionStore::increment_active() {
	int count = 0;
	auto res = update("INCR-AS", [&](ConnectionState &s) {
		auto old = s.active_streams;
		s.active_streams += 1;
		s.last_activity = utils::now_seconds();
		count = s.active_streams;
		spdlog::debug(
			"[{}] INCR-AS {} -> {}", session_id_, old, s.active_streams);
		return true;
	});
	if (!res) { return 0; }
	if (!res.value()) {
		spdlog::warn("[{}] INCR-AS failed: no state", session_id_);
		return 0;
	}
	return count;
}

bool SessionStore::decrement_active() {
	bool decremented = false;
	auto res = update("DECR-AS", [&](ConnectionState &s) {
		if (s.active_streams <= 0) {
			spdlog::warn("[{}] DECR-AS failed: active_streams already {}",
						 session_id_, s.active_streams);
			return false;
		}
		auto old = s.active_streams;
		s.active_streams -= 1;
		s.last_activity = utils::now_seconds();
		decremented = true;
		spdlog::debug(
			"[{}] DECR-AS {} -> {}", session_id_, old, s.active_streams);
		return true;
	});
	if (res && !res.value()) {
		spdlog::warn("[{}] DECR-AS failed: no state", session_id_);
	}
	return decremented;
}

bool SessionStore::has_active_streams() {
	auto state = fetch();
	return state && state.value() && state.value()->active_streams > 0;
}

// =============================================================================
// Capacity flag
// =============================================================================

Result<bool> SessionStore::claim_capacity(long long profile_id) {
	bool claimed = false;
	auto res = update("claim_capacity", [&](ConnectionState &s) {
		if (s.capacity_held) { return false; }
		s.capacity_held = true;
		s.profile_id = profile_id;
		claimed = true;
		return true;
	});
	if (!res) { return res.error(); }
	if (!res.value()) { return make_error_code(errc::session_not_found); }
	return claimed;
}

Result<void> SessionStore::drop_capacity_claim() {
	auto res = update("drop_capacity_claim", [](ConnectionState &s) {
		if (!s.capacity_held) { return false; }
		s.capacity_held = false;
		return true;
	});
	if (!res) { return res.error(); }
	return outcome::success();
}

Result<std::optional<long long>> SessionStore::release_capacity_if_idle() {
	std::optional<long long> profile;
	auto res = update("release_capacity", [&](ConnectionState &s) {
		if (s.active_streams > 0 || !s.capacity_held) { return false; }
		s.capacity_held = false;
		profile = s.profile_id;
		return true;
	});
	if (!res) { return res.error(); }
	return profile;
}

// =============================================================================
// Teardown
// =============================================================================

Result<bool> SessionStore::cleanup(std::string_view owner_worker_id,
								   const CapacityRelease &release) {
	auto state = fetch();
	if (!state) { return state.error(); }
	if (!state.value()) {
		spdlog::info("[{}] No session record found, nothing to clean up",
					 session_id_);
		return false;
	}

	if (state.value()->active_streams > 0) {
		if (!owner_worker_id.empty() &&
			state.value()->worker_id == owner_worker_id) {
			spdlog::info("[{}] Active streams present ({}) and owned by us, "
						 "keeping record",
						 session_id_, state.value()->active_streams);
		} else {
			spdlog::info("[{}] Active streams present ({}) owned by worker {}, "
						 "keeping record",
						 session_id_, state.value()->active_streams,
						 state.value()->worker_id);
		}
		return false;
	}

	store::DistributedLock lock(kv_, lock_key_, options_.lock);
	if (auto acquired = lock.acquire(); !acquired) {
		spdlog::warn(
			"[{}] Could not acquire lock for cleanup, skipping", session_id_);
		return acquired.error();
	}

	// Re-check: a stream may have started since the read above
	auto current = fetch();
	if (!current) { return current.error(); }
	if (!current.value()) {
		spdlog::info("[{}] Session record already removed", session_id_);
		return false;
	}
	const auto &latest = *current.value();
	if (latest.active_streams > 0) {
		spdlog::info("[{}] Active streams now present ({}), skipping cleanup",
					 session_id_, latest.active_streams);
		return false;
	}

	if (auto removed = kv_->remove({record_key_}); !removed) {
		return removed.error();
	}
	spdlog::info("[{}] Removed session record (verified no active streams)",
				 session_id_);

	if (latest.capacity_held && latest.profile_id) {
		if (release) {
			release(*latest.profile_id);
			spdlog::info("[{}] Released capacity for profile {}", session_id_,
						 *latest.profile_id);
		} else {
			spdlog::warn("[{}] Record held a slot of profile {} but no "
						 "release was requested",
						 session_id_, *latest.profile_id);
		}
	}

	// Lock key goes with the record
	lock.release();
	return true;
}

Result<void> SessionStore::touch(const TouchUpdate &update_fields) {
	auto res = update("touch", [&](ConnectionState &s) {
		auto now = utils::now_seconds();
		s.last_activity = now;
		if (update_fields.worker_id && s.worker_id != *update_fields.worker_id) {
			spdlog::info("[{}] Ownership transferred from worker {} to {}",
						 session_id_, s.worker_id, *update_fields.worker_id);
			s.worker_id = *update_fields.worker_id;
		}
		if (update_fields.bytes_sent) {
			s.bytes_sent = *update_fields.bytes_sent;
		}
		if (const auto &seek = update_fields.seek; seek && seek->total > 0) {
			s.last_seek_byte = seek->byte;
			s.total_content_size = seek->total;
			s.last_seek_percentage =
				static_cast<double>(seek->byte) / seek->total * 100.0;
			s.last_seek_timestamp = now;
			spdlog::info("[{}] Seek stored: {:.1f}% at byte {}/{}",
						 session_id_, s.last_seek_percentage, seek->byte,
						 seek->total);
		}
		return true;
	});
	if (!res) { return res.error(); }
	if (!res.value()) { return make_error_code(errc::session_not_found); }
	return outcome::success();
}

Result<std::optional<nlohmann::json>> SessionStore::session_info() {
	auto state = fetch();
	if (!state) { return state.error(); }
	if (!state.value()) { return std::optional<nlohmann::json>{}; }
	return std::optional<nlohmann::json>(nlohmann::json(*state.value()));
}

}  // namespace vodlink::session
