#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vodlink/config.hpp>
#include <vodlink/connection_state.hpp>
#include <vodlink/kv_store.hpp>
#include <vodlink/types.hpp>

#include "store/keys.hpp"

namespace vodlink::session {

struct MatchQuery {
	ContentRef content;
	ClientInfo client;
	TimeshiftParams timeshift;
};

struct MatchResult {
	std::string session_id;
	int score = 0;
	double last_activity = 0.0;
};

/// Finds an idle session worth reusing for a new request.
///
/// Records are found with a key-space SCAN; only idle ones
/// (active_streams == 0) for the same content are scored.
class SessionMatcher {
   public:
	SessionMatcher(std::shared_ptr<store::KeyValueStore> kv,
				   store::KeySchema keys = store::KeySchema{},
				   MatchWeights weights = {});

	std::optional<MatchResult> find_idle(const MatchQuery &query);

	/// Score of one record, 0 when it is not a candidate at all. The
	/// timeshift weight applies only when the query carries timeshift
	/// parameters.
	[[nodiscard]] int score(const ConnectionState &state,
							const MatchQuery &query) const;

   private:
	std::shared_ptr<store::KeyValueStore> kv_;
	store::KeySchema keys_;
	MatchWeights weights_;
};

}  // namespace vodlink::session
