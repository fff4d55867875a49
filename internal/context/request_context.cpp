#include "request_context.hpp"

namespace demonlist::context {

RequestData RequestData::Internal() {
  return RequestData();
}

RequestData RequestData::External(std::string ip) {
  RequestData data;
  data.internal_ = false;
  data.ip_       = std::move(ip);
  return data;
}

RequestData RequestData::WithUser(db::model::User user) const {
  RequestData data = *this;
  data.user_       = std::move(user);
  return data;
}

RequestData RequestData::WithPrecondition(Precondition precondition) const {
  RequestData data   = *this;
  data.precondition_ = std::move(precondition);
  return data;
}

RequestContext RequestData::Context(db::Connection& connection) const {
  if (internal_) {
    return RequestContext(InternalContext{&connection});
  }
  return RequestContext(ExternalContext{
      ip_,
      user_ ? &*user_ : nullptr,
      precondition_ ? &*precondition_ : nullptr,
      &connection,
  });
}

void RequestContext::CheckPermissions(const model::PermissionSet& required) const {
  if (required.Empty()) return;

  const auto* external = std::get_if<ExternalContext>(&inner_);
  if (!external) return;

  if (!external->user) {
    throw util::Unauthorized();
  }
  if (!external->user->permissions.Intersects(required)) {
    throw util::MissingPermissions(required);
  }
}

bool RequestContext::IsListModerator() const {
  const auto* external = std::get_if<ExternalContext>(&inner_);
  if (!external) return true;
  return external->user && external->user->permissions.Intersects(model::ListTeam());
}

const db::model::User* RequestContext::User() const {
  const auto* external = std::get_if<ExternalContext>(&inner_);
  return external ? external->user : nullptr;
}

std::string_view RequestContext::Ip() const {
  const auto* external = std::get_if<ExternalContext>(&inner_);
  return external ? external->ip : std::string_view();
}

db::Connection& RequestContext::Connection() const {
  return std::visit([](const auto& ctx) -> db::Connection& { return *ctx.connection; }, inner_);
}

} // namespace demonlist::context
