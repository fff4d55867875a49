#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/model/permissions.hpp"
#include "internal/model/record_status.hpp"

namespace demonlist::util {

/*
  Central error types.

  Every error carries a numeric code whose leading three digits are the
  HTTP status a transport layer would answer with (40301 -> 403).
  Commands never return partial results: the first error aborts the command.
*/

enum class ErrorKind {
  kUnauthorized,
  kMissingPermissions,
  kBannedFromSubmissions,
  kPermissionNotAssignable,
  kModelNotFound,
  kNameTaken,
  kDemonExists,
  kSubmissionExists,
  kPreconditionFailed,
  kInvalidField,
  kInvalidUsername,
  kInvalidPassword,
  kInvalidRequirement,
  kInvalidPosition,
  kInvalidProgress,
  kPlayerBanned,
  kSubmitLegacy,
  kNon100Extended,
  kInvalidVideo,
  kInvalidState,
  kDatabaseError,
  kConnectionUnavailable,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, int code, const std::string& msg);

  ErrorKind Kind() const {
    return kind_;
  }

  int Code() const {
    return code_;
  }

  int Status() const {
    return code_ / 100;
  }

 private:
  ErrorKind kind_;
  int       code_;
};

class Unauthorized : public Error {
 public:
  Unauthorized();
};

class MissingPermissions : public Error {
 public:
  explicit MissingPermissions(model::PermissionSet required);

  const model::PermissionSet& Required() const {
    return required_;
  }

 private:
  model::PermissionSet required_;
};

class BannedFromSubmissions : public Error {
 public:
  BannedFromSubmissions();
};

class PermissionNotAssignable : public Error {
 public:
  explicit PermissionNotAssignable(model::PermissionSet non_assignable);

  const model::PermissionSet& NonAssignable() const {
    return non_assignable_;
  }

 private:
  model::PermissionSet non_assignable_;
};

class ModelNotFound : public Error {
 public:
  ModelNotFound(std::string model, std::string identified_by);

  const std::string& Model() const {
    return model_;
  }
  const std::string& IdentifiedBy() const {
    return identified_by_;
  }

 private:
  std::string model_;
  std::string identified_by_;
};

class NameTaken : public Error {
 public:
  NameTaken();
};

class DemonExists : public Error {
 public:
  explicit DemonExists(int position);

  int Position() const {
    return position_;
  }

 private:
  int position_;
};

class SubmissionExists : public Error {
 public:
  SubmissionExists(model::RecordStatus status, std::int64_t existing);

  model::RecordStatus Status() const {
    return status_;
  }
  std::int64_t Existing() const {
    return existing_;
  }

 private:
  model::RecordStatus status_;
  std::int64_t        existing_;
};

class PreconditionFailed : public Error {
 public:
  PreconditionFailed();
};

class InvalidField : public Error {
 public:
  InvalidField(std::string field, const std::string& reason);

  const std::string& Field() const {
    return field_;
  }

 private:
  std::string field_;
};

class InvalidUsername : public Error {
 public:
  InvalidUsername();
};

class InvalidPassword : public Error {
 public:
  InvalidPassword();
};

class InvalidRequirement : public Error {
 public:
  InvalidRequirement();
};

class InvalidPosition : public Error {
 public:
  explicit InvalidPosition(int maximum);

  int Maximum() const {
    return maximum_;
  }

 private:
  int maximum_;
};

class InvalidProgress : public Error {
 public:
  explicit InvalidProgress(int requirement);

  int Requirement() const {
    return requirement_;
  }

 private:
  int requirement_;
};

class PlayerBanned : public Error {
 public:
  PlayerBanned();
};

class SubmitLegacy : public Error {
 public:
  SubmitLegacy();
};

class Non100Extended : public Error {
 public:
  Non100Extended();
};

// Raised by video validators; propagated to callers unchanged.
class InvalidVideo : public Error {
 public:
  explicit InvalidVideo(const std::string& reason);
};

// Internal contract violation. Indicates a bug in the calling code.
class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg);
};

// Wraps storage failures so driver error types never leave the db layer.
class DatabaseError : public Error {
 public:
  explicit DatabaseError(const std::string& msg);
};

class ConnectionUnavailable : public Error {
 public:
  explicit ConnectionUnavailable(const std::string& msg);
};

} // namespace demonlist::util
