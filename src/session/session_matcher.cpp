#include "session/session_matcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace vodlink::session {

SessionMatcher::SessionMatcher(std::shared_ptr<store::KeyValueStore> kv,
							   store::KeySchema keys, MatchWeights weights)
	: kv_(std::move(kv)), keys_(std::move(keys)), weights_(weights) {}

int SessionMatcher::score(const ConnectionState &state,
						  const MatchQuery &query) const {
	if (state.content_kind != query.content.kind ||
		state.content_id != query.content.id) {
		return 0;
	}
	if (state.active_streams > 0) { return 0; }

	int total = weights_.content;
	if (!state.client_ip.empty() && state.client_ip == query.client.ip) {
		total += weights_.client_ip;
	}
	if (!state.client_user_agent.empty() &&
		state.client_user_agent == query.client.user_agent) {
		total += weights_.user_agent;
	}
	// Plain plays carry no timeshift to compare
	if (!query.timeshift.empty() && state.timeshift == query.timeshift) {
		total += weights_.timeshift;
	}
	return total;
}

std::optional<MatchResult> SessionMatcher::find_idle(const MatchQuery &query) {
	auto keys = kv_->scan(keys_.session_pattern());
	if (!keys) {
		spdlog::error("Error finding matching idle session: {}",
					  keys.error().message());
		return std::nullopt;
	}

	std::vector<MatchResult> candidates;
	for (const auto &key : keys.value()) {
		auto id = keys_.session_id_from_key(key);
		if (id.empty()) { continue; }

		auto fields = kv_->hash_get_all(key);
		if (!fields || fields.value().empty()) { continue; }
		auto state = from_hash(fields.value());
		if (!state) {
			spdlog::debug("Skipping unreadable session record {}", key);
			continue;
		}

		int s = score(state.value(), query);
		if (s >= weights_.threshold) {
			spdlog::debug("[{}] Match candidate score={}", id, s);
			candidates.push_back({id, s, state.value().last_activity});
		}
	}

	if (candidates.empty()) {
		spdlog::debug("No matching idle session for {} {}",
					  to_string(query.content.kind), query.content.id);
		return std::nullopt;
	}

	auto best = std::max_element(
		candidates.begin(), candidates.end(),
		[](const MatchResult &a, const MatchResult &b) {
			if (a.score != b.score) { return a.score < b.score; }
			return a.last_activity < b.last_activity;
		});
	spdlog::info("[{}] Found matching idle session (score {})",
				 best->session_id, best->score);
	return *best;
}

}  // namespace vodlink::session
