#include "video_validator.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "internal/util/errors.hpp"

namespace demonlist::video {

HostListVideoValidator::HostListVideoValidator()
    : HostListVideoValidator({"youtube.com", "www.youtube.com", "m.youtube.com", "youtu.be", "twitch.tv", "www.twitch.tv", "vimeo.com",
                              "everyplay.com", "bilibili.com", "www.bilibili.com"}) {
}

HostListVideoValidator::HostListVideoValidator(std::vector<std::string> hosts) : hosts_(std::move(hosts)) {
}

std::string HostListVideoValidator::Validate(const std::string& raw) {
  std::string_view rest = raw;
  if (rest.substr(0, 8) == "https://") {
    rest.remove_prefix(8);
  } else if (rest.substr(0, 7) == "http://") {
    rest.remove_prefix(7);
  } else {
    throw util::InvalidVideo("unsupported scheme");
  }

  const auto  slash = rest.find_first_of("/?#");
  std::string host(rest.substr(0, slash));
  std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (host.empty() || std::find(hosts_.begin(), hosts_.end(), host) == hosts_.end()) {
    throw util::InvalidVideo("unsupported host '" + host + "'");
  }

  std::string path(slash == std::string_view::npos ? std::string_view() : rest.substr(slash));
  if (path.size() > 1 && path.back() == '/') path.pop_back();
  if (path == "/") path.clear();

  return "https://" + host + path;
}

} // namespace demonlist::video
