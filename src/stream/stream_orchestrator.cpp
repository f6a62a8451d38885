#include <spdlog/spdlog.h>

#include <array>
#include <boost/scope_exit.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdint>
#include <utility>
#include <vodlink/stream_orchestrator.hpp>

#include "capacity/capacity_reservation.hpp"
#include "session/session_matcher.hpp"
#include "session/session_store.hpp"
#include "store/keys.hpp"
#include "stream/byte_range.hpp"
#include "stream/byte_stream.hpp"
#include "stream/timeshift.hpp"
#include "utils.hpp"

namespace vodlink {

namespace {

// Client request headers passed on to the provider
constexpr std::array<std::pair<std::string_view, std::string_view>, 4>
	kForwardedHeaders{{
		{"authorization", "Authorization"},
		{"referer", "Referer"},
		{"origin", "Origin"},
		{"accept", "Accept"},
	}};

std::string generate_session_id() {
	thread_local boost::uuids::random_generator gen;
	return boost::uuids::to_string(gen());
}

enum class Cleanup : std::uint8_t { none, deferred, now };

void run_cleanup(session::SessionStore &store, const std::string &worker_id,
				 const session::CapacityRelease &release) {
	auto res = store.cleanup(worker_id, release);
	if (!res) {
		spdlog::warn("[{}] Cleanup failed: {}", store.session_id(),
					 res.error().message());
	}
}

// State this request has taken, undone when it cannot be served
struct Attempt {
	std::shared_ptr<session::SessionStore> store;
	bool counted = false;  // holds one active_streams reference
	bool settled = false;
};

}  // namespace

struct StreamOrchestrator::Impl
	: public std::enable_shared_from_this<StreamOrchestrator::Impl> {
	std::shared_ptr<store::KeyValueStore> kv;
	std::shared_ptr<net::UpstreamClient> upstream;
	std::shared_ptr<TaskScheduler> scheduler;
	Config config;
	store::KeySchema keys;
	session::SessionStoreOptions store_options;
	std::shared_ptr<capacity::CapacityReservation> capacity;
	session::SessionMatcher matcher;

	Impl(std::shared_ptr<store::KeyValueStore> kv_in,
		 std::shared_ptr<net::UpstreamClient> upstream_in,
		 std::shared_ptr<TaskScheduler> scheduler_in, Config config_in)
		: kv(std::move(kv_in)),
		  upstream(std::move(upstream_in)),
		  scheduler(std::move(scheduler_in)),
		  config(std::move(config_in)),
		  keys(config.key_prefix),
		  capacity(std::make_shared<capacity::CapacityReservation>(kv, keys)),
		  matcher(kv, keys, config.match) {
		if (config.worker_id.empty()) {
			config.worker_id = default_worker_id();
		}
		store_options.keys = keys;
		store_options.session_ttl = config.session_ttl;
		store_options.lock.ttl = config.lock_ttl;
		store_options.lock.wait = config.lock_wait;
		store_options.connect_timeout = config.connect_timeout;
		store_options.read_timeout = config.read_timeout;
	}

	session::CapacityRelease release_callback() const {
		return [capacity = capacity](long long profile_id) {
			capacity->release(profile_id);
		};
	}

	// =========================================================================
	// Responses
	// =========================================================================

	// An empty reason gives a response without body or Content-Type
	StreamResponse error_response(int status, std::string reason,
								  const std::string &session_id) const {
		StreamResponse response;
		response.status = status;
		response.session_id = session_id;
		if (!reason.empty()) {
			response.body = std::move(reason);
			response.headers["Content-Type"] = "text/plain";
		}
		response.headers["X-Worker-ID"] = config.worker_id;
		return response;
	}

	// =========================================================================
	// Teardown
	// =========================================================================

	// Give back the slot of an idle session. The capacity flag makes sure
	// only one caller per reservation gets to decrement the counter.
	void release_if_idle(session::SessionStore &store) {
		auto released = store.release_capacity_if_idle();
		if (!released) {
			spdlog::warn("[{}] Could not check capacity release: {}",
						 store.session_id(), released.error().message());
			return;
		}
		if (released.value()) {
			capacity->release(*released.value());
			spdlog::info("[{}] Profile counter decremented for profile {}",
						 store.session_id(), *released.value());
		}
	}

	void cleanup_now(session::SessionStore &store) {
		run_cleanup(store, config.worker_id, release_callback());
	}

	void schedule_cleanup(std::shared_ptr<session::SessionStore> store) {
		if (store->has_active_streams()) {
			spdlog::debug("[{}] Other streams still active, no cleanup",
						  store->session_id());
			return;
		}
		// Captures no Impl; the scheduler is never owned by its own tasks
		const bool accepted = scheduler && scheduler->schedule_after(
			config.cleanup_delay,
			[store, worker_id = config.worker_id, release = release_callback()] {
				spdlog::debug("[{}] Running delayed cleanup",
							  store->session_id());
				run_cleanup(*store, worker_id, release);
			});
		if (accepted) {
			spdlog::info("[{}] Scheduled cleanup in {} ms", store->session_id(),
						 config.cleanup_delay.count());
		} else {
			cleanup_now(*store);
		}
	}

	void rollback(Attempt &attempt, Cleanup cleanup) {
		attempt.settled = true;
		if (!attempt.store) { return; }
		try {
			if (attempt.counted) {
				attempt.store->decrement_active();
				attempt.counted = false;
			}
			release_if_idle(*attempt.store);
			switch (cleanup) {
				case Cleanup::none: break;
				case Cleanup::deferred:
					schedule_cleanup(attempt.store);
					break;
				case Cleanup::now:
					if (!attempt.store->has_active_streams()) {
						cleanup_now(*attempt.store);
					}
					break;
			}
		} catch (const std::exception &e) {
			spdlog::error("[{}] Rollback failed: {}",
						  attempt.store->session_id(), e.what());
		}
	}

	void finish_stream(const std::shared_ptr<session::SessionStore> &store,
					   StreamEnd end, std::uint64_t bytes_sent) {
		const auto &id = store->session_id();
		spdlog::info("[{}] Worker {} - Stream {}: {} bytes sent", id,
					 config.worker_id, to_string(end), bytes_sent);

		if (!store->decrement_active()) {
			spdlog::warn("[{}] Stream end not accounted", id);
		}
		release_if_idle(*store);

		if (end == StreamEnd::failed) {
			if (!store->has_active_streams()) { cleanup_now(*store); }
			return;
		}
		schedule_cleanup(store);
	}

	// =========================================================================
	// Request flow
	// =========================================================================

	// Reserve this session's slot unless it already holds one
	bool reclaim_capacity(session::SessionStore &store,
						  const ProviderProfile &profile) {
		if (profile.max_connections <= 0) { return true; }
		auto claimed = store.claim_capacity(profile.id);
		if (!claimed) {
			spdlog::warn("[{}] Could not claim capacity: {}",
						 store.session_id(), claimed.error().message());
			return false;
		}
		if (!claimed.value()) { return true; }
		if (capacity->reserve_slot(profile)) { return true; }

		if (auto dropped = store.drop_capacity_claim(); !dropped) {
			spdlog::error("[{}] Could not drop capacity claim: {}",
						  store.session_id(), dropped.error().message());
		}
		return false;
	}

	ConnectionState initial_state(const StreamRequest &request,
								  const std::string &session_id,
								  bool capacity_held) const {
		ConnectionState state;
		state.session_id = session_id;
		state.stream_url =
			stream::apply_timeshift(request.stream_url, request.timeshift);

		// Account agent first, the client's as fallback
		if (!request.profile.user_agent.empty()) {
			state.request_headers["User-Agent"] = request.profile.user_agent;
			spdlog::info("[{}] Using account user-agent: {}", session_id,
						 request.profile.user_agent);
		} else if (!request.client.user_agent.empty()) {
			state.request_headers["User-Agent"] = request.client.user_agent;
			spdlog::info("[{}] Using client user-agent: {}", session_id,
						 request.client.user_agent);
		} else {
			spdlog::warn("[{}] No user-agent available", session_id);
		}
		for (const auto &[name, canonical] : kForwardedHeaders) {
			if (auto value = utils::find_header(request.client_headers, name)) {
				state.request_headers[std::string(canonical)] = *value;
			}
		}

		const auto now = utils::now_seconds();
		state.worker_id = config.worker_id;
		state.last_activity = now;
		state.created_at = now;
		state.content_kind = request.content.kind;
		state.content_id = request.content.id;
		state.content_name = request.content.name;
		state.client_ip = request.client.ip;
		state.client_user_agent = request.client.user_agent;
		state.timeshift = request.timeshift;
		state.profile_id = request.profile.id;
		state.capacity_held = capacity_held;
		state.active_streams = 1;  // the creating request's stream
		return state;
	}

	StreamResponse serve(const StreamRequest &request) {
		Attempt attempt;
		BOOST_SCOPE_EXIT_ALL(&) {
			if (!attempt.settled) { rollback(attempt, Cleanup::now); }
		};

		const auto &profile = request.profile;
		const bool limited = profile.max_connections > 0;

		std::string session_id;
		bool matched = false;
		session::MatchQuery query{request.content, request.client,
								  request.timeshift};
		if (auto match = matcher.find_idle(query)) {
			// Claim it straight away so no cleanup can remove it under us
			session::SessionStore candidate(match->session_id, kv, upstream,
											store_options);
			if (candidate.increment_active() > 0) {
				spdlog::info("[{}] Worker {} - Reusing idle session (score {})",
							 match->session_id, config.worker_id,
							 match->score);
				session_id = match->session_id;
				matched = true;
			} else {
				spdlog::warn("[{}] Failed to reserve idle session, falling back "
							 "to a new one",
							 match->session_id);
			}
		}
		if (!matched) {
			session_id = request.session_id.empty() ? generate_session_id()
													: request.session_id;
		}

		spdlog::info("[{}] Worker {} - Streaming request for {} {}", session_id,
					 config.worker_id, to_string(request.content.kind),
					 request.content.name);

		attempt.store = std::make_shared<session::SessionStore>(
			session_id, kv, upstream, store_options);
		attempt.counted = matched;
		auto &store = *attempt.store;

		// A delayed cleanup can remove the record between fetch() and
		// increment_active(); the lookup then runs once more and recreates it
		for (int pass = 0;; ++pass) {
			auto existing = store.fetch();
			if (!existing) {
				spdlog::error("[{}] Could not read session: {}", session_id,
							  existing.error().message());
				rollback(attempt, Cleanup::none);
				return error_response(500, "Failed to read session",
									  session_id);
			}

			if (!existing.value()) {
				spdlog::info("[{}] Creating new session", session_id);
				if (!capacity->reserve_slot(profile)) {
					spdlog::warn("[{}] Profile {} connection limit exceeded",
								 session_id, profile.id);
					attempt.settled = true;
					return error_response(
						429, "Connection limit exceeded for profile",
						session_id);
				}

				auto created =
					store.create(initial_state(request, session_id, limited));
				if (!created) {
					spdlog::error("[{}] Failed to create session: {}",
								  session_id, created.error().message());
					if (limited) { capacity->release(profile.id); }
					attempt.settled = true;
					return error_response(500, "Failed to create connection",
										  session_id);
				}
				if (created.value()) {
					attempt.counted = true;
					break;
				}
				// Another worker created it first; our slot is not needed
				if (limited) { capacity->release(profile.id); }
			}

			spdlog::info("[{}] Using existing session", session_id);
			if (!attempt.counted) {
				if (store.increment_active() == 0) {
					if (pass == 0) {
						spdlog::info("[{}] Session removed while joining, "
									 "looking it up again",
									 session_id);
						continue;
					}
					spdlog::error("[{}] Failed to increment active streams",
								  session_id);
					attempt.settled = true;
					return error_response(500, "Failed to reserve stream",
										  session_id);
				}
				attempt.counted = true;
			}

			if (!reclaim_capacity(store, profile)) {
				spdlog::warn("[{}] Profile {} connection limit exceeded on "
							 "session reuse",
							 session_id, profile.id);
				rollback(attempt, Cleanup::none);
				return error_response(
					429, "Connection limit exceeded for profile", session_id);
			}

			session::TouchUpdate ownership;
			ownership.worker_id = config.worker_id;
			if (auto touched = store.touch(ownership); !touched) {
				spdlog::warn("[{}] Could not take ownership: {}", session_id,
							 touched.error().message());
			}
			break;
		}

		auto handle = store.open_upstream(request.range_header);
		if (!handle) {
			if (handle.error() == errc::range_not_satisfiable) {
				rollback(attempt, Cleanup::deferred);
				return error_response(416, {}, session_id);
			}
			rollback(attempt, Cleanup::now);
			return error_response(500, "Failed to connect to provider",
								  session_id);
		}

		auto response = build_response(request, handle.value(), store);
		response.stream = make_stream(attempt.store,
									  std::move(handle.value().response.body));
		// From here the stream's finalizer owns the reference
		attempt.settled = true;
		return response;
	}

	StreamResponse build_response(const StreamRequest &request,
								  const session::UpstreamHandle &handle,
								  session::SessionStore &store) {
		const auto &session_id = store.session_id();
		const auto &state = handle.state;
		StreamResponse response;
		response.session_id = session_id;
		response.headers["Content-Type"] =
			state.content_type.empty()
				? std::string(stream::kDefaultContentType)
				: state.content_type;
		response.headers["Cache-Control"] = "no-cache";
		response.headers["Pragma"] = "no-cache";
		response.headers["X-Content-Type-Options"] = "nosniff";
		response.headers["Connection"] = "keep-alive";
		response.headers["X-Worker-ID"] = config.worker_id;

		const bool ranged =
			request.range_header &&
			(handle.range || handle.response.status_code == 206);
		response.status = ranged ? 206 : 200;

		if (state.content_length) {
			const auto total = *state.content_length;
			response.headers["Accept-Ranges"] = "bytes";
			if (handle.range) {
				response.headers["Content-Range"] =
					stream::to_content_range(*handle.range, total);
				response.headers["Content-Length"] =
					std::to_string(handle.range->length());
			} else {
				response.headers["Content-Length"] = std::to_string(total);
			}

			if (handle.range && handle.range->start > 0) {
				session::TouchUpdate seek;
				seek.seek = session::SeekInfo{handle.range->start, total};
				if (auto touched = store.touch(seek); !touched) {
					spdlog::warn("[{}] Could not store seek position",
								 session_id);
				}
			}
		}
		return response;
	}

	ByteStream make_stream(std::shared_ptr<session::SessionStore> store,
						   std::unique_ptr<net::UpstreamBody> body) {
		auto self = shared_from_this();
		const auto stop_key = keys.client_stop(store->session_id());

		ByteStreamOptions options;
		options.chunk_size = config.chunk_size;
		options.check_interval = config.stop_check_interval;

		ByteStreamHooks hooks;
		hooks.checkpoint = [self, store, stop_key](std::uint64_t bytes) {
			auto stop = self->kv->exists(stop_key);
			if (stop && stop.value()) {
				spdlog::info("[{}] Worker {} - Stop signal detected, "
							 "terminating stream",
							 store->session_id(), self->config.worker_id);
				if (auto removed = self->kv->remove({stop_key}); !removed) {
					spdlog::warn("[{}] Could not clear stop signal",
								 store->session_id());
				}
				return false;
			}
			session::TouchUpdate progress;
			progress.bytes_sent = static_cast<long long>(bytes);
			if (auto touched = store->touch(progress); !touched) {
				spdlog::debug("[{}] Progress not stored: {}",
							  store->session_id(), touched.error().message());
			}
			return true;
		};
		hooks.finalize = [self, store](StreamEnd end, std::uint64_t bytes) {
			self->finish_stream(store, end, bytes);
		};

		spdlog::info("[{}] Worker {} - Starting stream", store->session_id(),
					 config.worker_id);
		return detail::ByteStreamAccess::make(std::move(body), options,
											  std::move(hooks));
	}
};

StreamOrchestrator::StreamOrchestrator(
	std::shared_ptr<store::KeyValueStore> kv,
	std::shared_ptr<net::UpstreamClient> upstream,
	std::shared_ptr<TaskScheduler> scheduler, Config config)
	: m_impl(std::make_shared<Impl>(std::move(kv), std::move(upstream),
									std::move(scheduler), std::move(config))) {
}

StreamOrchestrator::~StreamOrchestrator() = default;

StreamResponse StreamOrchestrator::stream(const StreamRequest &request) {
	try {
		return m_impl->serve(request);
	} catch (const std::exception &e) {
		spdlog::error("[{}] Streaming request failed: {}", request.session_id,
					  e.what());
		return m_impl->error_response(500, "Internal error",
									  request.session_id);
	}
}

const std::string &StreamOrchestrator::worker_id() const {
	return m_impl->config.worker_id;
}

}  // namespace vodlink
