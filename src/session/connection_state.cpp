#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <vodlink/connection_state.hpp>

#include "utils.hpp"

namespace vodlink {

namespace {

std::string format_double(double v) { return fmt::format("{:.6f}", v); }

std::string optional_to_string(const std::optional<long long> &v) {
	return v ? std::to_string(*v) : std::string{};
}

const std::string &field_or_empty(const HashFields &fields,
								  const std::string &name) {
	static const std::string kEmpty;
	auto it = fields.find(name);
	return it == fields.end() ? kEmpty : it->second;
}

// Numeric field readers: empty means "use default", anything else must parse.
template <typename T>
bool read_number(const HashFields &fields, const std::string &name, T &out) {
	const auto &raw = field_or_empty(fields, name);
	if (raw.empty()) { return true; }
	auto parsed = utils::to_number<T>(raw);
	if (!parsed) {
		spdlog::warn("Session field '{}' has malformed value '{}'", name, raw);
		return false;
	}
	out = parsed.value();
	return true;
}

bool read_optional(const HashFields &fields, const std::string &name,
				   std::optional<long long> &out) {
	const auto &raw = field_or_empty(fields, name);
	if (raw.empty()) {
		out.reset();
		return true;
	}
	auto parsed = utils::to_long(raw);
	if (!parsed) {
		spdlog::warn("Session field '{}' has malformed value '{}'", name, raw);
		return false;
	}
	out = parsed.value();
	return true;
}

}  // namespace

std::string_view to_string(ContentKind kind) {
	switch (kind) {
		case ContentKind::movie: return "movie";
		case ContentKind::episode: return "episode";
	}
	return "movie";
}

std::optional<ContentKind> parse_content_kind(std::string_view s) {
	if (s == "movie") return ContentKind::movie;
	if (s == "episode") return ContentKind::episode;
	return std::nullopt;
}

HashFields to_hash(const ConnectionState &state) {
	nlohmann::json headers(state.request_headers);

	return {
		{"session_id", state.session_id},
		{"stream_url", state.stream_url},
		{"headers", headers.dump()},
		{"content_length", optional_to_string(state.content_length)},
		{"content_type", state.content_type},
		{"final_url", state.final_url},
		{"profile_id", optional_to_string(state.profile_id)},
		{"capacity_held", state.capacity_held ? "1" : "0"},
		{"last_activity", format_double(state.last_activity)},
		{"request_count", std::to_string(state.request_count)},
		{"active_streams", std::to_string(state.active_streams)},
		// Session metadata
		{"content_kind", std::string(to_string(state.content_kind))},
		{"content_id", state.content_id},
		{"content_name", state.content_name},
		{"client_ip", state.client_ip},
		{"client_user_agent", state.client_user_agent},
		{"utc_start", state.timeshift.utc_start},
		{"utc_end", state.timeshift.utc_end},
		{"offset", state.timeshift.offset},
		{"worker_id", state.worker_id},
		{"created_at", format_double(state.created_at)},
		// Telemetry
		{"bytes_sent", std::to_string(state.bytes_sent)},
		{"position_seconds", std::to_string(state.position_seconds)},
		{"last_seek_byte", std::to_string(state.last_seek_byte)},
		{"last_seek_percentage", format_double(state.last_seek_percentage)},
		{"total_content_size", std::to_string(state.total_content_size)},
		{"last_seek_timestamp", format_double(state.last_seek_timestamp)}};
}

Result<ConnectionState> from_hash(const HashFields &fields) {
	ConnectionState s;
	s.session_id = field_or_empty(fields, "session_id");
	s.stream_url = field_or_empty(fields, "stream_url");
	if (s.session_id.empty() || s.stream_url.empty()) {
		return make_error_code(errc::corrupt_record);
	}

	const auto &headers_raw = field_or_empty(fields, "headers");
	if (!headers_raw.empty()) {
		try {
			auto j = nlohmann::json::parse(headers_raw);
			s.request_headers = j.get<std::map<std::string, std::string>>();
		} catch (const nlohmann::json::exception &e) {
			spdlog::warn("[{}] Malformed headers field: {}", s.session_id,
						 e.what());
			return make_error_code(errc::corrupt_record);
		}
	}

	s.content_type = field_or_empty(fields, "content_type");
	s.final_url = field_or_empty(fields, "final_url");
	s.worker_id = field_or_empty(fields, "worker_id");
	s.content_id = field_or_empty(fields, "content_id");
	s.content_name = field_or_empty(fields, "content_name");
	s.client_ip = field_or_empty(fields, "client_ip");
	s.client_user_agent = field_or_empty(fields, "client_user_agent");
	s.timeshift.utc_start = field_or_empty(fields, "utc_start");
	s.timeshift.utc_end = field_or_empty(fields, "utc_end");
	s.timeshift.offset = field_or_empty(fields, "offset");

	const auto &kind = field_or_empty(fields, "content_kind");
	if (!kind.empty()) {
		auto parsed = parse_content_kind(kind);
		if (!parsed) { return make_error_code(errc::corrupt_record); }
		s.content_kind = *parsed;
	}

	const auto &held = field_or_empty(fields, "capacity_held");
	if (held == "1") {
		s.capacity_held = true;
	} else if (!held.empty() && held != "0") {
		return make_error_code(errc::corrupt_record);
	}

	bool ok = read_optional(fields, "content_length", s.content_length) &&
			  read_optional(fields, "profile_id", s.profile_id) &&
			  read_number(fields, "last_activity", s.last_activity) &&
			  read_number(fields, "created_at", s.created_at) &&
			  read_number(fields, "active_streams", s.active_streams) &&
			  read_number(fields, "request_count", s.request_count) &&
			  read_number(fields, "bytes_sent", s.bytes_sent) &&
			  read_number(fields, "position_seconds", s.position_seconds) &&
			  read_number(fields, "last_seek_byte", s.last_seek_byte) &&
			  read_number(
				  fields, "last_seek_percentage", s.last_seek_percentage) &&
			  read_number(fields, "total_content_size", s.total_content_size) &&
			  read_number(
				  fields, "last_seek_timestamp", s.last_seek_timestamp);
	if (!ok) { return make_error_code(errc::corrupt_record); }

	if (s.active_streams < 0) {
		spdlog::warn("[{}] Negative active_streams in record, clamping to 0",
					 s.session_id);
		s.active_streams = 0;
	}
	return s;
}

void to_json(nlohmann::json &j, const ConnectionState &s) {
	j = nlohmann::json{
		{"session_id", s.session_id},
		{"stream_url", s.stream_url},
		{"final_url", s.final_url},
		{"content_type", s.content_type},
		{"worker_id", s.worker_id},
		{"last_activity", s.last_activity},
		{"created_at", s.created_at},
		{"active_streams", s.active_streams},
		{"capacity_held", s.capacity_held},
		{"request_count", s.request_count},
		{"content_kind", std::string(to_string(s.content_kind))},
		{"content_id", s.content_id},
		{"content_name", s.content_name},
		{"client_ip", s.client_ip},
		{"client_user_agent", s.client_user_agent},
		{"utc_start", s.timeshift.utc_start},
		{"utc_end", s.timeshift.utc_end},
		{"offset", s.timeshift.offset},
		{"bytes_sent", s.bytes_sent},
		{"position_seconds", s.position_seconds},
		{"last_seek_byte", s.last_seek_byte},
		{"last_seek_percentage", s.last_seek_percentage},
		{"total_content_size", s.total_content_size},
		{"last_seek_timestamp", s.last_seek_timestamp}};

	// Explicit null handling
	if (s.content_length)
		j["content_length"] = *s.content_length;
	else
		j["content_length"] = nullptr;
	if (s.profile_id)
		j["profile_id"] = *s.profile_id;
	else
		j["profile_id"] = nullptr;
}

}  // namespace vodlink
