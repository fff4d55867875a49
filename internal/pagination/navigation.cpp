#include "navigation.hpp"

namespace demonlist::pagination {

std::string Navigation::ToLinkHeader() const {
  std::string header;
  const auto  append = [&](const std::optional<std::string>& link, const char* rel) {
    if (!link) return;
    if (!header.empty()) header += ',';
    header += '<';
    header += *link;
    header += ">; rel=";
    header += rel;
  };

  append(first, "first");
  append(prev, "prev");
  append(next, "next");
  append(last, "last");
  return header;
}

} // namespace demonlist::pagination
