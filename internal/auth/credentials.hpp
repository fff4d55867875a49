#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/user.hpp"

namespace demonlist::auth {

/*
  Password hashing collaborator. The stored hash is also the secret
  material tokens are signed with.
*/
class PasswordHasher {
 public:
  virtual ~PasswordHasher() = default;

  virtual std::string Hash(const std::string& password) = 0;

  virtual bool Verify(const std::string& password, const std::string& hash) = 0;
};

/*
  Access token collaborator.

  Authentication is two-step: the user id is read from the token without
  checking its signature, the user is loaded, and only then is the token
  verified against that user's current secret.
*/
class TokenCodec {
 public:
  virtual ~TokenCodec() = default;

  virtual std::string Issue(const db::model::User& user) = 0;

  // nullopt for malformed tokens
  virtual std::optional<std::int64_t> DecodeUnverifiedId(const std::string& token) = 0;

  virtual bool Verify(const std::string& token, const db::model::User& user) = 0;
};

} // namespace demonlist::auth
