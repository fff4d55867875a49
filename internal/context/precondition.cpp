#include "precondition.hpp"

#include <algorithm>
#include <optional>
#include <sstream>

#include "internal/util/hash.hpp"

namespace demonlist::context {

namespace {

// Field values are length-prefixed so that ("ab","c") and ("a","bc") differ.
class Canonical {
 public:
  explicit Canonical(std::string_view kind) {
    out_ << kind;
  }

  Canonical& Field(std::string_view value) {
    out_ << '|' << value.size() << ':' << value;
    return *this;
  }

  Canonical& Field(const std::string& value) {
    return Field(std::string_view(value));
  }

  Canonical& Field(std::int64_t value) {
    return Field(std::string_view(std::to_string(value)));
  }

  Canonical& Field(const std::optional<std::string>& value) {
    if (!value) {
      out_ << "|-";
      return *this;
    }
    return Field(std::string_view(*value));
  }

  std::string Digest() const {
    return util::Sha256Hex(out_.str());
  }

 private:
  std::ostringstream out_;
};

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

} // namespace

Precondition Precondition::Any() {
  Precondition p;
  p.wildcard_ = true;
  return p;
}

Precondition Precondition::Of(std::vector<std::string> tags) {
  Precondition p;
  p.tags_ = std::move(tags);
  return p;
}

Precondition Precondition::Parse(std::string_view if_match) {
  if (Trim(if_match) == "*") return Any();

  std::vector<std::string> tags;
  while (!if_match.empty()) {
    const auto       comma = if_match.find(',');
    std::string_view tag   = Trim(if_match.substr(0, comma));
    if_match.remove_prefix(comma == std::string_view::npos ? if_match.size() : comma + 1);

    if (tag.substr(0, 2) == "W/") tag.remove_prefix(2);
    if (tag.size() >= 2 && tag.front() == '"' && tag.back() == '"') tag = tag.substr(1, tag.size() - 2);
    if (!tag.empty()) tags.emplace_back(tag);
  }
  return Of(std::move(tags));
}

bool Precondition::Met(const std::string& tag) const {
  if (wildcard_) return true;
  return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

std::string Etag(const db::model::Player& player) {
  return Canonical("player").Field(player.id).Field(player.name).Field(player.banned ? 1 : 0).Digest();
}

std::string Etag(const db::model::Demon& demon) {
  return Canonical("demon")
      .Field(demon.name)
      .Field(demon.position)
      .Field(demon.requirement)
      .Field(demon.video)
      .Field(demon.verifier)
      .Field(demon.publisher)
      .Digest();
}

std::string Etag(const db::model::Submitter& submitter) {
  return Canonical("submitter").Field(submitter.id).Field(submitter.ip).Field(submitter.banned ? 1 : 0).Digest();
}

std::string Etag(const db::model::Record& record) {
  return Canonical("record")
      .Field(record.id)
      .Field(record.progress)
      .Field(record.video)
      .Field(static_cast<std::int64_t>(record.status))
      .Field(record.player)
      .Field(record.submitter)
      .Field(record.demon)
      .Digest();
}

std::string Etag(const db::model::User& user) {
  // password_hash is secret material and stays out of the tag
  return Canonical("user")
      .Field(user.id)
      .Field(user.name)
      .Field(user.display_name)
      .Field(user.youtube_channel)
      .Field(static_cast<std::int64_t>(user.permissions.Bits()))
      .Digest();
}

} // namespace demonlist::context
