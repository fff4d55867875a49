#pragma once

#include "internal/auth/credentials.hpp"

namespace demonlist::auth {

/*
  PBKDF2-HMAC-SHA256 with a random 16 byte salt.

  Stored form: pbkdf2-sha256$<iterations>$<salt hex>$<key hex>
*/
class Pbkdf2PasswordHasher final : public PasswordHasher {
 public:
  explicit Pbkdf2PasswordHasher(int iterations = 100000);

  std::string Hash(const std::string& password) override;

  bool Verify(const std::string& password, const std::string& hash) override;

 private:
  int iterations_;
};

/*
  Tokens of the form <user id>.<hex HMAC-SHA256(key = server secret + password hash, msg = user id)>.

  Rotating a user's password hash invalidates every token issued before.
*/
class HmacTokenCodec final : public TokenCodec {
 public:
  explicit HmacTokenCodec(std::string server_secret);

  std::string Issue(const db::model::User& user) override;

  std::optional<std::int64_t> DecodeUnverifiedId(const std::string& token) override;

  bool Verify(const std::string& token, const db::model::User& user) override;

 private:
  std::string Sign(const db::model::User& user) const;

  std::string server_secret_;
};

} // namespace demonlist::auth
