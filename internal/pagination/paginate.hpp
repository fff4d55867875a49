#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/context/request_context.hpp"
#include "internal/db/api/types.hpp"
#include "internal/executor/database_executor.hpp"
#include "internal/pagination/navigation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace demonlist::pagination {

/*
  Keyset pagination over an integer id.

  P provides:
    using Item; using Filter; static constexpr kName;
    std::optional<std::int64_t> before, after, limit;
    model::PermissionSet RequiredPermissions() const;
    Filter ToFilter() const;
    void EncodeFilters(util::QueryString&) const;
    static std::vector<Item> Fetch(db::Repository&, db::Connection&, const Filter&, const db::Keyset&);
*/
template <typename P>
struct Paginate {
  using Result = Page<typename P::Item>;

  static constexpr const char* kName = P::kName;

  context::RequestData request;
  P                    pagination;

  Result Handle(executor::DatabaseExecutor& executor) const {
    auto ctx = request.Context(executor.Connection());
    ctx.CheckPermissions(pagination.RequiredPermissions());

    const auto& services = executor.Services();
    const auto  limit    = pagination.limit.value_or(static_cast<std::int64_t>(services.default_page_limit));
    if (limit < 1 || limit > static_cast<std::int64_t>(services.max_page_limit)) {
      throw util::InvalidField("limit", "must be between 1 and " + std::to_string(services.max_page_limit));
    }
    if (pagination.after && pagination.before && *pagination.after >= *pagination.before) {
      throw util::InvalidField("before", "must be greater than after");
    }

    auto&      repo   = executor.Repository();
    auto&      conn   = ctx.Connection();
    const auto filter = pagination.ToFilter();

    // with only a lower bound missing, the window hugs `before`
    db::Keyset window;
    window.after      = pagination.after;
    window.before     = pagination.before;
    window.limit      = static_cast<std::size_t>(limit);
    window.descending = pagination.before.has_value() && !pagination.after.has_value();

    Result page;
    page.items = P::Fetch(repo, conn, filter, window);
    if (window.descending) std::reverse(page.items.begin(), page.items.end());

    const auto first = Boundary(repo, conn, filter, std::nullopt, std::nullopt, false);
    if (!first) {
      return page;
    }
    const auto last = Boundary(repo, conn, filter, std::nullopt, std::nullopt, true);

    page.navigation.first = Link(limit, "after", *first - 1);
    page.navigation.last  = Link(limit, "before", *last + 1);

    if (!page.items.empty()) {
      const auto window_first = P::IdOf(page.items.front());
      const auto window_last  = P::IdOf(page.items.back());

      if (Boundary(repo, conn, filter, window_last, std::nullopt, false)) {
        page.navigation.next = Link(limit, "after", window_last);
      }
      if (Boundary(repo, conn, filter, std::nullopt, window_first, true)) {
        page.navigation.prev = Link(limit, "before", window_first);
      }
    }
    return page;
  }

 private:
  // Id of the first matching row in (after, before), walking from the top when `descending`.
  static std::optional<std::int64_t> Boundary(db::Repository& repo, db::Connection& conn, const typename P::Filter& filter,
                                              std::optional<std::int64_t> after, std::optional<std::int64_t> before, bool descending) {
    db::Keyset keyset;
    keyset.after      = after;
    keyset.before     = before;
    keyset.limit      = 1;
    keyset.descending = descending;

    auto rows = P::Fetch(repo, conn, filter, keyset);
    if (rows.empty()) return std::nullopt;
    return P::IdOf(rows.front());
  }

  std::string Link(std::int64_t limit, const char* cursor, std::int64_t value) const {
    util::QueryString query;
    pagination.EncodeFilters(query);
    query.Add("limit", static_cast<long long>(limit));
    query.Add(cursor, static_cast<long long>(value));
    return query.ToString();
  }
};

} // namespace demonlist::pagination
