#pragma once

#include <optional>
#include <string>
#include <vector>

namespace demonlist::pagination {

/*
  first/prev/next/last links of a page, each an encoded query string.
  A link is absent when there is nothing to navigate to.
*/
struct Navigation {
  std::optional<std::string> first;
  std::optional<std::string> prev;
  std::optional<std::string> next;
  std::optional<std::string> last;

  // RFC 5988 style: <query>; rel=first,<query>; rel=next ... absent links are left out
  std::string ToLinkHeader() const;

  bool Empty() const {
    return !first && !prev && !next && !last;
  }
};

template <typename Item>
struct Page {
  std::vector<Item> items;
  Navigation        navigation;
};

} // namespace demonlist::pagination
