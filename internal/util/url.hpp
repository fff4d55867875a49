#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace demonlist::util {

// RFC 3986 percent-encoding; unreserved characters pass through.
std::string PercentEncode(std::string_view value);

/*
  Ordered key=value list rendered as an application/x-www-form-urlencoded
  query string. Keys keep insertion order.
*/
class QueryString {
 public:
  QueryString& Add(std::string_view key, std::string_view value);
  QueryString& Add(std::string_view key, long long value);

  std::string ToString() const;

 private:
  std::vector<std::pair<std::string, std::string>> pairs_;
};

} // namespace demonlist::util
