#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace a11yscan::fetch {

// Media type of a Content-Type header value: lowercased, parameters dropped.
// "Text/HTML; charset=UTF-8" -> "text/html".
[[nodiscard]] std::string media_type_of(std::string_view content_type);

// True for text/html and application/xhtml+xml.
[[nodiscard]] bool is_html_media_type(std::string_view content_type);

// Value of the charset parameter, unquoted, or nullopt when absent or empty.
[[nodiscard]] std::optional<std::string> charset_of(std::string_view content_type);

}  // namespace a11yscan::fetch
