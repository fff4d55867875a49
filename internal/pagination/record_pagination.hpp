#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/record.hpp"
#include "internal/model/permissions.hpp"
#include "internal/model/record_status.hpp"
#include "internal/util/url.hpp"

namespace demonlist::pagination {

/*
  Record listing. Approved records are public; any other status filter,
  or none at all, needs a list team member.
*/
struct RecordPagination {
  using Item   = db::model::Record;
  using Filter = db::RecordFilter;

  static constexpr const char* kName = "PaginateRecords";

  std::optional<model::RecordStatus> status;
  std::optional<std::int64_t>        player;
  std::optional<std::string>         demon;
  std::optional<std::int64_t>        submitter;

  std::optional<std::int64_t> before;
  std::optional<std::int64_t> after;
  std::optional<std::int64_t> limit;

  model::PermissionSet RequiredPermissions() const;

  Filter ToFilter() const;
  void   EncodeFilters(util::QueryString& query) const;

  static std::vector<Item> Fetch(db::Repository& repo, db::Connection& conn, const Filter& filter, const db::Keyset& keyset);

  static std::int64_t IdOf(const Item& record) {
    return record.id;
  }
};

} // namespace demonlist::pagination
