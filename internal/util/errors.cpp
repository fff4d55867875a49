#include "errors.hpp"

#include <utility>

namespace demonlist::util {

Error::Error(ErrorKind kind, int code, const std::string& msg) : std::runtime_error(msg), kind_(kind), code_(code) {
}

Unauthorized::Unauthorized()
    : Error(ErrorKind::kUnauthorized, 40100, "The request requires user authentication, which failed or was not provided") {
}

MissingPermissions::MissingPermissions(model::PermissionSet required)
    : Error(ErrorKind::kMissingPermissions, 40301, "You do not have any of the required permissions: " + required.ToString()),
      required_(required) {
}

BannedFromSubmissions::BannedFromSubmissions()
    : Error(ErrorKind::kBannedFromSubmissions, 40302, "You have been banned from submitting records to the demonlist") {
}

PermissionNotAssignable::PermissionNotAssignable(model::PermissionSet non_assignable)
    : Error(ErrorKind::kPermissionNotAssignable, 40303, "You cannot assign the following permissions: " + non_assignable.ToString()),
      non_assignable_(non_assignable) {
}

ModelNotFound::ModelNotFound(std::string model, std::string identified_by)
    : Error(ErrorKind::kModelNotFound, 40401, "No " + model + " identified by '" + identified_by + "' found"),
      model_(std::move(model)),
      identified_by_(std::move(identified_by)) {
}

NameTaken::NameTaken() : Error(ErrorKind::kNameTaken, 40902, "The chosen name is already taken") {
}

DemonExists::DemonExists(int position)
    : Error(ErrorKind::kDemonExists, 40904, "A demon with that name already exists at position " + std::to_string(position)),
      position_(position) {
}

SubmissionExists::SubmissionExists(model::RecordStatus status, std::int64_t existing)
    : Error(ErrorKind::kSubmissionExists, 40905,
            "A " + std::string(model::ToString(status)) + " record for this player and demon already exists (id " + std::to_string(existing) + ")"),
      status_(status),
      existing_(existing) {
}

PreconditionFailed::PreconditionFailed()
    : Error(ErrorKind::kPreconditionFailed, 41200, "The entity was modified since it was last retrieved") {
}

InvalidField::InvalidField(std::string field, const std::string& reason)
    : Error(ErrorKind::kInvalidField, 42200, "Invalid value for '" + field + "': " + reason), field_(std::move(field)) {
}

InvalidUsername::InvalidUsername()
    : Error(ErrorKind::kInvalidUsername, 42202, "Usernames must be at least 3 characters long and not start or end with spaces") {
}

InvalidPassword::InvalidPassword() : Error(ErrorKind::kInvalidPassword, 42204, "Passwords must be at least 10 characters long") {
}

InvalidRequirement::InvalidRequirement()
    : Error(ErrorKind::kInvalidRequirement, 42212, "The record requirement must be between 0 and 100 inclusive") {
}

InvalidPosition::InvalidPosition(int maximum)
    : Error(ErrorKind::kInvalidPosition, 42213, "Demon positions must be between 1 and " + std::to_string(maximum) + " inclusive"),
      maximum_(maximum) {
}

InvalidProgress::InvalidProgress(int requirement)
    : Error(ErrorKind::kInvalidProgress, 42215, "Record progress must lie between " + std::to_string(requirement) + " and 100 inclusive"),
      requirement_(requirement) {
}

PlayerBanned::PlayerBanned() : Error(ErrorKind::kPlayerBanned, 42216, "The player is banned from having records on the list") {
}

SubmitLegacy::SubmitLegacy() : Error(ErrorKind::kSubmitLegacy, 42217, "Records for legacy demons are not accepted") {
}

Non100Extended::Non100Extended()
    : Error(ErrorKind::kNon100Extended, 42218, "Records for demons on the extended list must have 100% progress") {
}

InvalidVideo::InvalidVideo(const std::string& reason) : Error(ErrorKind::kInvalidVideo, 42222, "Invalid video: " + reason) {
}

InvalidState::InvalidState(const std::string& msg) : Error(ErrorKind::kInvalidState, 50001, msg) {
}

DatabaseError::DatabaseError(const std::string& msg) : Error(ErrorKind::kDatabaseError, 50003, "Database error: " + msg) {
}

ConnectionUnavailable::ConnectionUnavailable(const std::string& msg)
    : Error(ErrorKind::kConnectionUnavailable, 50302, "Database connection unavailable: " + msg) {
}

} // namespace demonlist::util
