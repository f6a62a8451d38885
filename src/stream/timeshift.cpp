#include "stream/timeshift.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/regex.hpp>
#include <boost/url.hpp>

#include "utils.hpp"

namespace vodlink::stream {

namespace {

const boost::regex &iso_regex() {
	static const boost::regex re(
		R"(^(\d{4})-(\d{2})-(\d{2}))"
		R"((?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?)"
		R"((?:Z|[+-]\d{2}:?\d{2})?$)");
	return re;
}

const boost::regex &catchup_regex() {
	static const boost::regex re(
		R"(/catchup/\d{4}-\d{2}-\d{2}/\d{2}-\d{2}-\d{2}/)");
	return re;
}

int field(const boost::smatch &m, int idx) {
	if (!m[idx].matched) { return 0; }
	return utils::to_number_default<int>(m[idx].str());
}

}  // namespace

std::optional<CatchupStamp> parse_iso_timestamp(std::string_view value) {
	std::string s(value);
	boost::smatch m;
	if (!boost::regex_match(s, m, iso_regex())) { return std::nullopt; }

	int year = field(m, 1);
	int month = field(m, 2);
	int day = field(m, 3);
	int hour = field(m, 4);
	int minute = field(m, 5);
	int second = field(m, 6);

	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
		minute > 59 || second > 59) {
		return std::nullopt;
	}

	return CatchupStamp{fmt::format("{:04}-{:02}-{:02}", year, month, day),
						fmt::format("{:02}-{:02}-{:02}", hour, minute, second)};
}

std::string apply_timeshift(const std::string &url,
							const TimeshiftParams &params) {
	if (params.empty()) { return url; }

	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) {
		spdlog::warn("Cannot apply timeshift to unparsable URL {}", url);
		return url;
	}
	boost::urls::url u(u_res.value());
	auto query = u.params();

	if (!params.utc_start.empty()) {
		query.set("utc_start", params.utc_start);
		query.set("start", params.utc_start);
	}
	if (!params.utc_end.empty()) {
		query.set("utc_end", params.utc_end);
		query.set("end", params.utc_end);
	}
	if (!params.offset.empty()) {
		if (auto seconds = utils::to_long(params.offset)) {
			auto v = std::to_string(seconds.value());
			query.set("offset", v);
			query.set("seek", v);
			query.set("t", v);
		} else {
			spdlog::warn("Ignoring non-integer timeshift offset {}",
						 params.offset);
		}
	}

	if (!params.utc_start.empty()) {
		std::string path = u.encoded_path();
		if (boost::regex_search(path, catchup_regex())) {
			if (auto stamp = parse_iso_timestamp(params.utc_start)) {
				path = boost::regex_replace(
					path, catchup_regex(),
					fmt::format("/catchup/{}/{}/", stamp->date, stamp->time));
				u.set_encoded_path(path);
			} else {
				spdlog::warn("Could not parse timeshift start {}",
							 params.utc_start);
			}
		}
	}

	std::string rewritten(u.buffer());
	spdlog::debug("Timeshift URL {} -> {}", url, rewritten);
	return rewritten;
}

}  // namespace vodlink::stream
