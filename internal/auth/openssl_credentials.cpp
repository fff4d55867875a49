#include "openssl_credentials.hpp"

#include <charconv>
#include <string_view>
#include <vector>

#include "internal/util/hash.hpp"

namespace demonlist::auth {

namespace {

constexpr std::string_view kScheme = "pbkdf2-sha256";

std::vector<std::string_view> Split(std::string_view value, char separator) {
  std::vector<std::string_view> parts;
  while (true) {
    const auto pos = value.find(separator);
    parts.push_back(value.substr(0, pos));
    if (pos == std::string_view::npos) break;
    value.remove_prefix(pos + 1);
  }
  return parts;
}

} // namespace

// ------------------------------------------------------------------
// Pbkdf2PasswordHasher
// ------------------------------------------------------------------

Pbkdf2PasswordHasher::Pbkdf2PasswordHasher(int iterations) : iterations_(iterations > 0 ? iterations : 1) {
}

std::string Pbkdf2PasswordHasher::Hash(const std::string& password) {
  const auto salt = util::RandomHex(16);
  return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" + salt + "$" + util::Pbkdf2Sha256Hex(password, salt, iterations_);
}

bool Pbkdf2PasswordHasher::Verify(const std::string& password, const std::string& hash) {
  const auto parts = Split(hash, '$');
  if (parts.size() != 4 || parts[0] != kScheme) return false;

  int iterations = 0;
  const auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), iterations);
  if (ec != std::errc() || ptr != parts[1].data() + parts[1].size() || iterations <= 0) return false;

  return util::ConstantTimeEquals(util::Pbkdf2Sha256Hex(password, parts[2], iterations), parts[3]);
}

// ------------------------------------------------------------------
// HmacTokenCodec
// ------------------------------------------------------------------

HmacTokenCodec::HmacTokenCodec(std::string server_secret) : server_secret_(std::move(server_secret)) {
}

std::string HmacTokenCodec::Sign(const db::model::User& user) const {
  return util::HmacSha256Hex(server_secret_ + user.password_hash, std::to_string(user.id));
}

std::string HmacTokenCodec::Issue(const db::model::User& user) {
  return std::to_string(user.id) + "." + Sign(user);
}

std::optional<std::int64_t> HmacTokenCodec::DecodeUnverifiedId(const std::string& token) {
  const auto dot = token.find('.');
  if (dot == std::string::npos || dot == 0) return std::nullopt;

  std::int64_t id = 0;
  const auto [ptr, ec] = std::from_chars(token.data(), token.data() + dot, id);
  if (ec != std::errc() || ptr != token.data() + dot) return std::nullopt;
  return id;
}

bool HmacTokenCodec::Verify(const std::string& token, const db::model::User& user) {
  const auto dot = token.find('.');
  if (dot == std::string::npos) return false;
  if (std::string_view(token).substr(0, dot) != std::to_string(user.id)) return false;
  return util::ConstantTimeEquals(std::string_view(token).substr(dot + 1), Sign(user));
}

} // namespace demonlist::auth
