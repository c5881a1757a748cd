#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "identity/error.hpp"
#include "identity/schema_document.hpp"

namespace sid::identity {

/// Everything a type's identity hash is computed over.
struct HashEnvelope {
  std::string name;
  Json ser_by_alias;
  Json ser_by_name;
  /// Present only when validation-mode tracking is enabled.
  std::optional<Json> val_by_alias;
  Json extra_data = nullptr;
};

/// `{"name", "schemas": {"ser_by_alias", "ser_by_name", ["val_by_alias"]}, "extra_data"}`.
auto envelope_schemas(const HashEnvelope& envelope) -> Json;
auto envelope_to_json(const HashEnvelope& envelope) -> Json;

/// Copy of `value` with object keys in sorted order at every level.
auto sort_keys(const Json& value) -> Json;

/// Compact JSON bytes of the envelope. With `sort_object_keys` every object is
/// emitted in key order, otherwise in insertion order. Encoding failures
/// (e.g. invalid UTF-8) are Serialization errors naming `type_name`.
auto serialize_envelope(const HashEnvelope& envelope, bool sort_object_keys,
                        std::string_view type_name)
  -> Expected<std::string>;

}  // namespace sid::identity
