#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sid::identity {

/// Schema documents keep object keys in insertion order; field order is only
/// observable through that order.
using Json = nlohmann::ordered_json;

using TypeId = std::uint64_t;

enum class SchemaMode {
  Serialization,
  Validation,
};

enum class Aliasing {
  ByAlias,
  ByName,
};

inline auto to_string(SchemaMode mode) -> std::string_view {
  return mode == SchemaMode::Validation ? "validation" : "serialization";
}

inline auto to_string(Aliasing aliasing) -> std::string_view {
  return aliasing == Aliasing::ByAlias ? "by_alias" : "by_name";
}

inline auto parse_schema_mode(std::string_view text) -> std::optional<SchemaMode> {
  if (text == "serialization") return SchemaMode::Serialization;
  if (text == "validation") return SchemaMode::Validation;
  return std::nullopt;
}

}  // namespace sid::identity
