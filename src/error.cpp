#include <string>
#include <vodlink/result.hpp>

namespace vodlink {

struct vodlink_error_category : std::error_category {
	const char *name() const noexcept override { return "vodlink"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::capacity_exceeded:
				return "Connection limit exceeded for profile";
			case errc::range_not_satisfiable:
				return "Requested range not satisfiable";
			case errc::upstream_failed: return "Upstream request failed";
			case errc::upstream_http_error: return "Upstream HTTP error";
			case errc::invalid_url: return "Invalid URL";
			case errc::too_many_redirects: return "Too many redirects";
			case errc::lock_timeout: return "Timed out waiting for lock";
			case errc::store_unavailable: return "Key/value store unavailable";
			case errc::session_not_found: return "Session not found";
			case errc::corrupt_record: return "Corrupt session record";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::stream_cancelled: return "Stream cancelled";
			default: return "Unknown error";
		}
	}
};

const std::error_category &vodlink_category() {
	static vodlink_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), vodlink_category()};
}

}  // namespace vodlink
