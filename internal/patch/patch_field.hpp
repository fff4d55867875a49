#pragma once

#include <optional>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace demonlist::patch {

/*
  One field of a partial update: absent (leave as is), explicitly null,
  or a new value.
*/
template <typename T>
class PatchField {
 public:
  PatchField() = default;

  static PatchField Null() {
    PatchField field;
    field.state_ = State::kNull;
    return field;
  }

  static PatchField Of(T value) {
    PatchField field;
    field.state_ = State::kValue;
    field.value_ = std::move(value);
    return field;
  }

  bool IsAbsent() const {
    return state_ == State::kAbsent;
  }

  bool IsPresent() const {
    return state_ != State::kAbsent;
  }

  bool IsNull() const {
    return state_ == State::kNull;
  }

  const T& Value() const {
    return *value_;
  }

  // For fields that may not be cleared: the value, or InvalidField{name} on null.
  const T& Require(const std::string& name) const {
    if (state_ != State::kValue) {
      throw util::InvalidField(name, "must not be null");
    }
    return *value_;
  }

  // For nullable fields: nullopt when explicitly null.
  std::optional<T> AsOptional() const {
    return state_ == State::kValue ? value_ : std::nullopt;
  }

 private:
  enum class State { kAbsent, kNull, kValue };

  State            state_ = State::kAbsent;
  std::optional<T> value_;
};

// Leading/trailing whitespace removed.
std::string Trimmed(const std::string& value);

} // namespace demonlist::patch
