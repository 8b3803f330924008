#include "a11yscan/fetch/fetch_config.h"

namespace a11yscan::fetch {

std::string validate_fetch_config(const FetchConfig& config) {
  if (config.timeout.count() <= 0) {
    return "Invalid fetch timeout: must be greater than 0 ms";
  }
  if (config.max_redirects < 0) {
    return "Invalid max redirects: must be 0 or greater";
  }
  if (config.max_body_bytes == 0) {
    return "Invalid max body size: must be greater than 0 bytes";
  }
  if (config.user_agent.empty()) {
    return "Invalid user agent: must not be empty";
  }
  return {};
}

}  // namespace a11yscan::fetch
