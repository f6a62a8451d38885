#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace vodlink::store {

/// Redis key layout shared by every worker. All keys live under one prefix so
/// several deployments can share a Redis database.
class KeySchema {
   public:
	explicit KeySchema(std::string prefix = "vodlink:")
		: prefix_(std::move(prefix)) {}

	[[nodiscard]] std::string session(std::string_view id) const {
		return fmt::format("{}session:{}", prefix_, id);
	}

	[[nodiscard]] std::string session_lock(std::string_view id) const {
		return fmt::format("{}session:{}:lock", prefix_, id);
	}

	[[nodiscard]] std::string profile_connections(long long profile_id) const {
		return fmt::format("{}profile:{}:connections", prefix_, profile_id);
	}

	[[nodiscard]] std::string client_stop(std::string_view client_id) const {
		return fmt::format("{}client:{}:stop", prefix_, client_id);
	}

	[[nodiscard]] std::string session_pattern() const {
		return fmt::format("{}session:*", prefix_);
	}

	/// Session id from a key matched by session_pattern(), or empty when the
	/// key is not a record key (e.g. a lock key).
	[[nodiscard]] std::string session_id_from_key(std::string_view key) const {
		const auto head = prefix_ + "session:";
		if (key.substr(0, head.size()) != head) { return {}; }
		auto id = key.substr(head.size());
		constexpr std::string_view kLockSuffix = ":lock";
		if (id.size() >= kLockSuffix.size() &&
			id.substr(id.size() - kLockSuffix.size()) == kLockSuffix) {
			return {};
		}
		return std::string(id);
	}

	[[nodiscard]] const std::string &prefix() const { return prefix_; }

   private:
	std::string prefix_;
};

}  // namespace vodlink::store
