#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace sid::identity {

enum class ErrorCode {
  /// Schema-mode override combined with validation-mode tracking.
  ConfigConflict,
  /// Hash input envelope could not be encoded.
  Serialization,
  /// Schema provider failed to produce a document.
  Provider,
  /// TypeId not present in the catalog.
  UnknownType,
  /// Malformed JSON definition (models or hash config).
  InvalidDefinition,
};

struct IdentityError {
  ErrorCode code = ErrorCode::Provider;
  std::string message;
  /// Qualified (or bare) name of the type the failure belongs to, when known.
  std::string type_name;
  /// Underlying cause reported by a collaborator (encoder, provider).
  std::string cause;
};

template <typename T>
using Expected = tl::expected<T, IdentityError>;

inline auto make_error(ErrorCode code, std::string message) -> IdentityError {
  return IdentityError{code, std::move(message), {}, {}};
}

inline auto make_error(ErrorCode code, std::string message, std::string type_name,
                       std::string cause = {}) -> IdentityError {
  return IdentityError{code, std::move(message), std::move(type_name), std::move(cause)};
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::ConfigConflict:
      return "config_conflict";
    case ErrorCode::Serialization:
      return "serialization";
    case ErrorCode::Provider:
      return "provider";
    case ErrorCode::UnknownType:
      return "unknown_type";
    case ErrorCode::InvalidDefinition:
      return "invalid_definition";
  }
  return "unknown";
}

}  // namespace sid::identity
