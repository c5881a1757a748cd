#include "identity/hash_config.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace sid::identity {
namespace {

auto invalid(std::string message) -> IdentityError {
  return make_error(ErrorCode::InvalidDefinition, "hash_config: " + std::move(message));
}

auto read_bool(const Json& value, std::string_view key) -> Expected<bool> {
  if (!value.is_boolean()) {
    return tl::unexpected(invalid(std::string(key) + " must be a boolean"));
  }
  return value.get<bool>();
}

auto read_limit(const Json& value) -> Expected<std::size_t> {
  if (value.is_null() || (value.is_string() && value.get<std::string>() == "unbounded")) {
    return kUnboundedLength;
  }
  if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
    return tl::unexpected(
      invalid("hash_limit_length must be a non-negative integer, null or \"unbounded\""));
  }
  return static_cast<std::size_t>(value.get<std::int64_t>());
}

}  // namespace

auto resolve_config(const HashConfig& base, const HashConfigOverrides& overrides) -> HashConfig {
  HashConfig config = base;
  if (overrides.track_descriptions) config.track_descriptions = *overrides.track_descriptions;
  if (overrides.track_field_order) config.track_field_order = *overrides.track_field_order;
  if (overrides.track_type_order) config.track_type_order = *overrides.track_type_order;
  if (overrides.tracked_extra_data) config.tracked_extra_data = *overrides.tracked_extra_data;
  if (overrides.hash_limit_length) config.hash_limit_length = *overrides.hash_limit_length;
  if (overrides.tracked_filepath_parts) {
    config.tracked_filepath_parts = *overrides.tracked_filepath_parts;
  }
  if (overrides.hash_function && *overrides.hash_function) {
    config.hash_function = *overrides.hash_function;
  }
  if (overrides.track_validation_mode) {
    config.track_validation_mode = *overrides.track_validation_mode;
  }
  return config;
}

auto canonical_policy(const HashConfig& config) -> CanonicalPolicy {
  CanonicalPolicy policy;
  policy.sort_required = !config.track_field_order;
  policy.drop_descriptions = !config.track_descriptions;
  policy.sort_lists = !config.track_type_order;
  return policy;
}

auto hash_settings(const HashConfig& config) -> HashSettings {
  HashSettings settings;
  settings.track_descriptions = config.track_descriptions;
  settings.track_field_order = config.track_field_order;
  settings.track_type_order = config.track_type_order;
  settings.tracked_filepath_parts = config.tracked_filepath_parts;
  settings.track_validation_mode = config.track_validation_mode;
  return settings;
}

auto validate_config(const HashConfig& config, std::optional<SchemaMode> schema_mode_override,
                     std::string_view type_name) -> Expected<void> {
  if (schema_mode_override && config.track_validation_mode) {
    return tl::unexpected(make_error(
      ErrorCode::ConfigConflict,
      "type '" + std::string(type_name) + "' sets schema_mode_override='" +
        std::string(to_string(*schema_mode_override)) +
        "', but validation-mode tracking needs both serialization and validation schemas; "
        "remove the override or disable track_validation_mode",
      std::string(type_name)));
  }
  return {};
}

auto parse_hash_config_json(const Json& json) -> Expected<HashConfigOverrides> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("must be an object"));
  }

  HashConfigOverrides overrides;
  for (auto it = json.begin(); it != json.end(); ++it) {
    const auto& key = it.key();
    const auto& value = it.value();

    if (key == "track_descriptions" || key == "track_field_order" ||
        key == "track_type_order" || key == "track_validation_mode") {
      auto flag = read_bool(value, key);
      if (!flag) {
        return tl::unexpected(flag.error());
      }
      if (key == "track_descriptions") {
        overrides.track_descriptions = *flag;
      } else if (key == "track_field_order") {
        overrides.track_field_order = *flag;
      } else if (key == "track_type_order") {
        overrides.track_type_order = *flag;
      } else {
        overrides.track_validation_mode = *flag;
      }
    } else if (key == "tracked_extra_data") {
      overrides.tracked_extra_data = value;
    } else if (key == "hash_limit_length") {
      auto limit = read_limit(value);
      if (!limit) {
        return tl::unexpected(limit.error());
      }
      overrides.hash_limit_length = *limit;
    } else if (key == "tracked_filepath_parts") {
      if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
          value.get<std::int64_t>() > std::numeric_limits<int>::max()) {
        return tl::unexpected(invalid("tracked_filepath_parts must be a non-negative integer"));
      }
      overrides.tracked_filepath_parts = value.get<int>();
    } else if (key == "hash_function") {
      if (!value.is_string()) {
        return tl::unexpected(invalid("hash_function must be a string"));
      }
      auto fn = find_hash_function(value.get<std::string>());
      if (!fn) {
        return tl::unexpected(invalid("unknown hash_function '" + value.get<std::string>() + "'"));
      }
      overrides.hash_function = std::move(*fn);
    } else {
      return tl::unexpected(invalid("unknown key '" + key + "'"));
    }
  }
  return overrides;
}

}  // namespace sid::identity
