#pragma once

#include <cstdint>
#include <string>

#include "internal/context/request_context.hpp"
#include "internal/db/model/user.hpp"
#include "internal/executor/database_executor.hpp"
#include "internal/patch/user_patch.hpp"

namespace demonlist::commands {

using executor::DatabaseExecutor;

/*
  Creates an account without permissions.

  The name must be at least 3 characters and carry no surrounding
  whitespace; the password at least 10 characters.
*/
struct Register {
  using Result                       = db::model::User;
  static constexpr const char* kName = "Register";

  std::string name;
  std::string password;

  Result Handle(DatabaseExecutor& executor) const;
};

struct UserById {
  using Result                       = db::model::User;
  static constexpr const char* kName = "UserById";

  std::int64_t id;

  Result Handle(DatabaseExecutor& executor) const;
};

struct UserByName {
  using Result                       = db::model::User;
  static constexpr const char* kName = "UserByName";

  std::string name;

  Result Handle(DatabaseExecutor& executor) const;
};

// Administrator on external requests.
struct DeleteUserById {
  using Result                       = void;
  static constexpr const char* kName = "DeleteUserById";

  context::RequestData request;
  std::int64_t         id;

  void Handle(DatabaseExecutor& executor) const;
};

// Every failure, malformed token included, is Unauthorized.
struct TokenAuth {
  using Result                       = db::model::User;
  static constexpr const char* kName = "TokenAuth";

  std::string token;

  Result Handle(DatabaseExecutor& executor) const;
};

struct BasicAuth {
  using Result                       = db::model::User;
  static constexpr const char* kName = "BasicAuth";

  std::string username;
  std::string password;

  Result Handle(DatabaseExecutor& executor) const;
};

// Access token bound to the user's current password hash.
struct IssueToken {
  using Result                       = std::string;
  static constexpr const char* kName = "IssueToken";

  db::model::User user;

  Result Handle(DatabaseExecutor& executor) const;
};

// The acting user patching their own account.
struct PatchCurrentUser {
  using Result                       = db::model::User;
  static constexpr const char* kName = "PatchCurrentUser";

  context::RequestData request;
  db::model::User      user;
  patch::PatchMe       patch;

  Result Handle(DatabaseExecutor& executor) const;
};

/*
  Re-hashes the password of a user authenticated by name and password,
  rotating the secret tokens are signed with. Tokens issued before stop
  verifying.
*/
struct Invalidate {
  using Result                       = void;
  static constexpr const char* kName = "Invalidate";

  std::string username;
  std::string password;

  void Handle(DatabaseExecutor& executor) const;
};

} // namespace demonlist::commands
