#include "url.hpp"

namespace demonlist::util {

std::string PercentEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                            c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[(c >> 4) & 0x0F]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

QueryString& QueryString::Add(std::string_view key, std::string_view value) {
  pairs_.emplace_back(PercentEncode(key), PercentEncode(value));
  return *this;
}

QueryString& QueryString::Add(std::string_view key, long long value) {
  return Add(key, std::string_view(std::to_string(value)));
}

std::string QueryString::ToString() const {
  std::string out;
  for (const auto& [key, value] : pairs_) {
    if (!out.empty()) out.push_back('&');
    out += key;
    out.push_back('=');
    out += value;
  }
  return out;
}

} // namespace demonlist::util
