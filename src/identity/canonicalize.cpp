#include "identity/canonicalize.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace sid::identity {
namespace {

constexpr auto kDescriptionKey = "description";
constexpr auto kRequiredKey = "required";
constexpr auto kDefaultKey = "default";

auto normalize_value(const Json& value, const CanonicalPolicy& policy) -> Json;

auto collapse_list(const Json& list, const CanonicalPolicy& policy) -> Json {
  // sort_required is not reapplied while normalizing the elements.
  CanonicalPolicy nested = policy;
  nested.sort_required = false;

  std::vector<std::string> items;
  items.reserve(list.size());
  for (const auto& element : list) {
    items.push_back(coerce_to_string(normalize_value(element, nested)));
  }
  std::sort(items.begin(), items.end());
  return Json(items);
}

auto normalize_list(const std::string& key, const Json& list, const CanonicalPolicy& policy)
  -> Json {
  if (policy.sort_required && key == kRequiredKey && list.front().is_string()) {
    Json sorted = list;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
  }
  if (policy.sort_lists) {
    return collapse_list(list, policy);
  }
  return list;
}

auto normalize_object(const Json& object, const CanonicalPolicy& policy) -> Json {
  Json out = Json::object();
  for (auto it = object.begin(); it != object.end(); ++it) {
    const auto& key = it.key();
    const auto& child = it.value();

    if (policy.drop_descriptions && key == kDescriptionKey && child.is_string()) {
      continue;
    }
    if (key == kDefaultKey) {
      out[key] = child;
      continue;
    }
    if (child.is_array() && !child.empty()) {
      out[key] = normalize_value(normalize_list(key, child, policy), policy);
      continue;
    }
    out[key] = normalize_value(child, policy);
  }
  return out;
}

auto normalize_value(const Json& value, const CanonicalPolicy& policy) -> Json {
  if (value.is_object()) {
    return normalize_object(value, policy);
  }
  if (value.is_array()) {
    Json out = Json::array();
    for (const auto& element : value) {
      out.push_back(normalize_value(element, policy));
    }
    return out;
  }
  return value;
}

}  // namespace

auto normalize(const Json& document, const CanonicalPolicy& policy) -> Json {
  return normalize_value(document, policy);
}

auto coerce_to_string(const Json& value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

}  // namespace sid::identity
