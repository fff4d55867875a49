#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/context/precondition.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/db/model/user.hpp"
#include "internal/model/permissions.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::context {

class RequestContext;

/*
  Owned, per-request input to a command.

  Built by the caller before the command is queued. Internal requests are
  trusted system operations; external ones carry the client address and
  optionally an authenticated user and a precondition.
*/
class RequestData {
 public:
  static RequestData Internal();
  static RequestData External(std::string ip);

  RequestData WithUser(db::model::User user) const;
  RequestData WithPrecondition(Precondition precondition) const;

  bool IsInternal() const {
    return internal_;
  }

  // Borrowing view for one command; must not outlive this object or `connection`.
  RequestContext Context(db::Connection& connection) const;

 private:
  RequestData() = default;

  bool                           internal_ = true;
  std::string                    ip_;
  std::optional<db::model::User> user_;
  std::optional<Precondition>    precondition_;
};

struct InternalContext {
  db::Connection* connection;
};

struct ExternalContext {
  std::string_view       ip;
  const db::model::User* user;
  const Precondition*    precondition;
  db::Connection*        connection;
};

/*
  Context a command handler checks authorization and preconditions against.
*/
class RequestContext {
 public:
  explicit RequestContext(InternalContext internal) : inner_(internal) {
  }
  explicit RequestContext(ExternalContext external) : inner_(external) {
  }

  bool IsInternal() const {
    return std::holds_alternative<InternalContext>(inner_);
  }

  // Passes when `required` is empty or intersects the user's permissions.
  // Throws Unauthorized without a user, MissingPermissions otherwise.
  void CheckPermissions(const model::PermissionSet& required) const;

  // Throws PreconditionFailed on mismatch, InvalidState when an external
  // request declared no precondition.
  template <typename Entity>
  void CheckPrecondition(const Entity& entity) const {
    const auto* external = std::get_if<ExternalContext>(&inner_);
    if (!external) return;
    if (!external->precondition) {
      throw util::InvalidState("precondition check on a request without If-Match");
    }
    if (!external->precondition->Met(Etag(entity))) {
      throw util::PreconditionFailed();
    }
  }

  // Internal requests and any member of the list team.
  bool IsListModerator() const;

  // nullptr for internal and anonymous requests
  const db::model::User* User() const;

  std::string_view Ip() const;

  db::Connection& Connection() const;

 private:
  std::variant<InternalContext, ExternalContext> inner_;
};

} // namespace demonlist::context
