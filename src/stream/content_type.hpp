#pragma once

#include <optional>
#include <string_view>

namespace vodlink::stream {

inline constexpr std::string_view kDefaultContentType = "video/mp4";

/// MIME type guessed from the file extension of a URL's path, ignoring
/// query and fragment. nullopt for unknown or missing extensions.
std::optional<std::string_view> content_type_from_url(std::string_view url);

}  // namespace vodlink::stream
