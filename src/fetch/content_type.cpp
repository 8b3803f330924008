#include "a11yscan/fetch/content_type.h"

#include "a11yscan/core/normalization.h"

namespace a11yscan::fetch {

std::string media_type_of(std::string_view content_type) {
  const auto semicolon = content_type.find(';');
  return core::normalize_ascii_lower(core::trim(content_type.substr(0, semicolon)));
}

bool is_html_media_type(std::string_view content_type) {
  const std::string media_type = media_type_of(content_type);
  return media_type == "text/html" || media_type == "application/xhtml+xml";
}

std::optional<std::string> charset_of(std::string_view content_type) {
  std::size_t pos = content_type.find(';');
  while (pos != std::string_view::npos) {
    const std::size_t next = content_type.find(';', pos + 1);
    const std::string_view param = content_type.substr(pos + 1, next == std::string_view::npos
                                                                    ? std::string_view::npos
                                                                    : next - pos - 1);
    const auto eq = param.find('=');
    if (eq != std::string_view::npos &&
        core::normalize_ascii_lower(core::trim(param.substr(0, eq))) == "charset") {
      std::string value = core::trim(param.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      if (value.empty()) {
        return std::nullopt;
      }
      return value;
    }
    pos = next;
  }
  return std::nullopt;
}

}  // namespace a11yscan::fetch
