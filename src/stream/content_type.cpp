#include "stream/content_type.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/url.hpp>
#include <string>
#include <utility>

namespace vodlink::stream {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 13>
	kVideoTypes{{
		{".mp4", "video/mp4"},
		{".mkv", "video/x-matroska"},
		{".avi", "video/x-msvideo"},
		{".mov", "video/quicktime"},
		{".wmv", "video/x-ms-wmv"},
		{".flv", "video/x-flv"},
		{".webm", "video/webm"},
		{".m4v", "video/x-m4v"},
		{".3gp", "video/3gpp"},
		{".ts", "video/mp2t"},
		{".m3u8", "application/x-mpegURL"},
		{".mpg", "video/mpeg"},
		{".mpeg", "video/mpeg"},
	}};

}  // namespace

std::optional<std::string_view> content_type_from_url(std::string_view url) {
	std::string path;
	auto u_res = boost::urls::parse_uri_reference(url);
	if (u_res.has_error()) {
		// Not a URL we can split; treat everything before '?' as the path
		path = std::string(url.substr(0, url.find('?')));
	} else {
		path = u_res.value().path();
	}

	auto slash = path.rfind('/');
	auto name = slash == std::string::npos ? path : path.substr(slash + 1);
	auto dot = name.rfind('.');
	if (dot == std::string::npos || dot == 0) { return std::nullopt; }

	auto ext = boost::algorithm::to_lower_copy(name.substr(dot));
	for (const auto &[known, mime] : kVideoTypes) {
		if (ext == known) {
			spdlog::debug("Inferred content type {} from {}", mime, url);
			return mime;
		}
	}
	return std::nullopt;
}

}  // namespace vodlink::stream
