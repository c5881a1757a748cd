#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "identity/canonicalize.hpp"
#include "identity/digest.hpp"
#include "identity/error.hpp"
#include "identity/schema_document.hpp"

namespace sid::identity {

/// Resolved per-type hashing configuration.
struct HashConfig {
  /// Include documentation strings in the hash.
  bool track_descriptions = false;
  /// Field declaration order affects the hash.
  bool track_field_order = false;
  /// Ordering within unions, enums and other lists in type annotations affects the hash.
  bool track_type_order = false;
  /// Arbitrary JSON payload folded into the hash (null when unset).
  Json tracked_extra_data = nullptr;
  /// Truncation length; kUnboundedLength keeps the full digest.
  std::size_t hash_limit_length = 12;
  /// Trailing path segments of the declaring file used in the qualified name.
  int tracked_filepath_parts = 2;
  HashFunction hash_function = default_hash_function();
  /// Also hash the validation-mode document.
  bool track_validation_mode = true;
};

/// Per-type overrides, applied on top of the base type's resolved config at
/// definition time. Unset members inherit.
struct HashConfigOverrides {
  std::optional<bool> track_descriptions;
  std::optional<bool> track_field_order;
  std::optional<bool> track_type_order;
  std::optional<Json> tracked_extra_data;
  std::optional<std::size_t> hash_limit_length;
  std::optional<int> tracked_filepath_parts;
  std::optional<HashFunction> hash_function;
  std::optional<bool> track_validation_mode;
};

/// Snapshot of the tracking settings recorded in an identity report.
struct HashSettings {
  bool track_descriptions = false;
  bool track_field_order = false;
  bool track_type_order = false;
  int tracked_filepath_parts = 2;
  bool track_validation_mode = true;

  auto operator==(const HashSettings&) const -> bool = default;
};

auto resolve_config(const HashConfig& base, const HashConfigOverrides& overrides) -> HashConfig;

auto canonical_policy(const HashConfig& config) -> CanonicalPolicy;

auto hash_settings(const HashConfig& config) -> HashSettings;

/// Rejects configurations whose schema documents cannot all be generated:
/// a schema-mode override together with validation-mode tracking.
auto validate_config(const HashConfig& config, std::optional<SchemaMode> schema_mode_override,
                     std::string_view type_name) -> Expected<void>;

/// Parse overrides from a JSON object (keys as in HashConfig).
auto parse_hash_config_json(const Json& json) -> Expected<HashConfigOverrides>;

}  // namespace sid::identity
