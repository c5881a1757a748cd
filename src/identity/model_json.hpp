#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "identity/error.hpp"
#include "identity/schema_document.hpp"
#include "identity/type_catalog.hpp"

namespace sid::identity {

/// Parse one model definition. `base` and nested `model` references are
/// names resolved through `known`, which holds earlier definitions.
auto parse_model_json(const Json& json,
                      const std::unordered_map<std::string, TypeId>& known) -> Expected<ModelDef>;

/// Define every model of `{"models": [...]}` in order. Returns their ids.
/// Models without a "file" entry are recorded as declared in `default_file`
/// (bare names when that is empty too).
auto load_models_json(const Json& json, TypeCatalog& catalog, std::string_view default_file = {})
  -> Expected<std::vector<TypeId>>;

}  // namespace sid::identity
