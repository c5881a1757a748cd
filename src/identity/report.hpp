#pragma once

#include <chrono>
#include <string>

#include "identity/hash_config.hpp"
#include "identity/schema_document.hpp"

namespace sid::identity {

/// Identifying information about a type's schema at the time it was hashed.
struct IdentityReport {
  std::string fullname;
  std::chrono::system_clock::time_point created_at;
  std::string hash;
  HashSettings hash_settings;
};

/// `{"fullname", "date", "hash", "hash_settings": {...}}`, date as ISO-8601 UTC.
auto report_to_json(const IdentityReport& report) -> Json;

auto settings_to_json(const HashSettings& settings) -> Json;

auto format_timestamp(std::chrono::system_clock::time_point time) -> std::string;

}  // namespace sid::identity
