#include "identity/model_json.hpp"

#include <source_location>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace sid::identity {
namespace {

auto invalid(std::string message) -> IdentityError {
  return make_error(ErrorCode::InvalidDefinition, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(
      invalid(std::string(context) + ": missing or invalid field '" + std::string(field) + "'"));
  }
  return it->get<std::string>();
}

auto get_optional_string(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::optional<std::string>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return tl::unexpected(
      invalid(std::string(context) + ": field '" + std::string(field) + "' must be a string"));
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto resolve_name(const std::unordered_map<std::string, TypeId>& known, const std::string& name,
                  std::string_view context) -> Expected<TypeId> {
  auto it = known.find(name);
  if (it == known.end()) {
    return tl::unexpected(
      invalid(std::string(context) + ": unknown model '" + name + "' (define it earlier)"));
  }
  return it->second;
}

auto parse_field_json(const Json& json, const std::unordered_map<std::string, TypeId>& known,
                      const std::string& model_name) -> Expected<FieldDecl> {
  if (!json.is_object()) {
    return tl::unexpected(invalid(model_name + ": field entry must be an object"));
  }
  auto name = get_string_field(json, "name", model_name + " field");
  if (!name) {
    return tl::unexpected(name.error());
  }
  const auto context = model_name + "." + *name;

  FieldDecl field;
  field.name = std::move(*name);

  if (auto it = json.find("model"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(invalid(context + ": model must be a string"));
    }
    auto id = resolve_name(known, it->get<std::string>(), context);
    if (!id) {
      return tl::unexpected(id.error());
    }
    field.model = *id;
  } else if (auto schema_it = json.find("schema"); schema_it != json.end()) {
    if (!schema_it->is_object()) {
      return tl::unexpected(invalid(context + ": schema must be an object"));
    }
    field.schema = *schema_it;
  } else {
    return tl::unexpected(invalid(context + ": either 'schema' or 'model' is required"));
  }

  if (auto it = json.find("validation_schema"); it != json.end()) {
    if (!it->is_object()) {
      return tl::unexpected(invalid(context + ": validation_schema must be an object"));
    }
    field.validation_schema = *it;
  }
  if (auto it = json.find("default"); it != json.end()) {
    field.default_value = *it;
  }

  for (auto [key, target] : {std::pair{"alias", &field.alias},
                             std::pair{"validation_alias", &field.validation_alias},
                             std::pair{"description", &field.description}}) {
    auto value = get_optional_string(json, key, context);
    if (!value) {
      return tl::unexpected(value.error());
    }
    *target = std::move(*value);
  }
  return field;
}

}  // namespace

auto parse_model_json(const Json& json, const std::unordered_map<std::string, TypeId>& known)
  -> Expected<ModelDef> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("model entry must be an object"));
  }
  auto name = get_string_field(json, "name", "model");
  if (!name) {
    return tl::unexpected(name.error());
  }

  ModelDef def;
  def.name = std::move(*name);

  auto file = get_optional_string(json, "file", def.name);
  if (!file) {
    return tl::unexpected(file.error());
  }
  def.declaring_file = file->value_or("");

  auto doc = get_optional_string(json, "doc", def.name);
  if (!doc) {
    return tl::unexpected(doc.error());
  }
  def.doc = std::move(*doc);

  auto base = get_optional_string(json, "base", def.name);
  if (!base) {
    return tl::unexpected(base.error());
  }
  if (*base) {
    auto id = resolve_name(known, **base, def.name);
    if (!id) {
      return tl::unexpected(id.error());
    }
    def.base = *id;
  }

  auto mode = get_optional_string(json, "schema_mode_override", def.name);
  if (!mode) {
    return tl::unexpected(mode.error());
  }
  if (*mode) {
    def.schema_mode_override = parse_schema_mode(**mode);
    if (!def.schema_mode_override) {
      return tl::unexpected(
        invalid(def.name + ": schema_mode_override must be 'serialization' or 'validation'"));
    }
  }

  if (auto it = json.find("hash_config"); it != json.end()) {
    auto overrides = parse_hash_config_json(*it);
    if (!overrides) {
      auto error = overrides.error();
      error.message = def.name + ": " + error.message;
      return tl::unexpected(std::move(error));
    }
    def.hash_config = std::move(*overrides);
  }

  if (auto it = json.find("fields"); it != json.end()) {
    if (!it->is_array()) {
      return tl::unexpected(invalid(def.name + ": fields must be an array"));
    }
    std::unordered_set<std::string> names;
    for (const auto& field_json : *it) {
      auto field = parse_field_json(field_json, known, def.name);
      if (!field) {
        return tl::unexpected(field.error());
      }
      if (!names.insert(field->name).second) {
        return tl::unexpected(invalid(def.name + ": duplicate field '" + field->name + "'"));
      }
      def.fields.push_back(std::move(*field));
    }
  }
  return def;
}

auto load_models_json(const Json& json, TypeCatalog& catalog, std::string_view default_file)
  -> Expected<std::vector<TypeId>> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("model definitions must be an object"));
  }
  auto models_it = json.find("models");
  if (models_it == json.end() || !models_it->is_array()) {
    return tl::unexpected(invalid("models must be an array"));
  }

  std::unordered_map<std::string, TypeId> known;
  std::vector<TypeId> ids;
  for (const auto& model_json : *models_it) {
    auto def = parse_model_json(model_json, known);
    if (!def) {
      return tl::unexpected(def.error());
    }
    if (def->declaring_file.empty()) {
      def->declaring_file = std::string(default_file);
    }
    auto name = def->name;
    if (known.contains(name)) {
      return tl::unexpected(invalid("duplicate model name: " + name));
    }
    auto id = catalog.define(std::move(*def), std::source_location{});
    if (!id) {
      return tl::unexpected(id.error());
    }
    known.emplace(std::move(name), *id);
    ids.push_back(*id);
  }
  return ids;
}

}  // namespace sid::identity
