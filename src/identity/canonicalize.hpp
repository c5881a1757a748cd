#pragma once

#include <string>

#include "identity/schema_document.hpp"

namespace sid::identity {

/// Which variations of a schema document are irrelevant to the hash.
struct CanonicalPolicy {
  /// Sort `required` lists whose first element is a string.
  bool sort_required = false;
  /// Drop string-valued `description` entries.
  bool drop_descriptions = false;
  /// Collapse every other non-empty list (except under `default`) into a sorted
  /// list of string-coerced, already-normalized elements.
  bool sort_lists = false;
};

/// Returns the normalized copy of `document`. Values stored under `default`
/// are copied untouched at any depth.
///
/// The list collapse is lossy: distinct nested lists can coerce to the same
/// sorted strings. Hashes depend on exactly this behavior.
auto normalize(const Json& document, const CanonicalPolicy& policy) -> Json;

/// String coercion used by the list collapse: strings keep their content,
/// everything else is its compact JSON encoding.
auto coerce_to_string(const Json& value) -> std::string;

}  // namespace sid::identity
