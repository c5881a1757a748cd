#include "identity/schema_provider.hpp"

#include <cctype>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "identity/fullname.hpp"

namespace sid::identity {
namespace {

class SchemaBuilder {
 public:
  SchemaBuilder(const TypeCatalog& catalog, SchemaMode mode, Aliasing aliasing)
      : catalog_(catalog), mode_(mode), aliasing_(aliasing) {}

  auto build_root(const ModelType& type) -> Expected<Json> {
    visited_.insert(type.id);
    auto root = build_model(type);
    if (!root) {
      return root;
    }
    if (!defs_.empty()) {
      (*root)["$defs"] = std::move(defs_);
    }
    return root;
  }

 private:
  auto property_key(const FieldDecl& field) const -> const std::string& {
    if (aliasing_ == Aliasing::ByName) {
      return field.name;
    }
    if (mode_ == SchemaMode::Validation && field.validation_alias) {
      return *field.validation_alias;
    }
    return field.alias ? *field.alias : field.name;
  }

  /// `$defs` key of a nested model. Distinct types sharing a name are told
  /// apart by their declaring path, then by their id.
  auto def_key(const ModelType& type) -> std::string {
    if (auto it = def_keys_.find(type.id); it != def_keys_.end()) {
      return it->second;
    }
    std::string key = type.name;
    for (int parts = 1; taken_keys_.contains(key); ++parts) {
      auto candidate = qualified_name(type.declaring_file, type.name, parts);
      if (candidate == key) {
        break;
      }
      key = std::move(candidate);
    }
    while (taken_keys_.contains(key)) {
      key += "_" + std::to_string(type.id);
    }
    taken_keys_.insert(key);
    def_keys_.emplace(type.id, key);
    return key;
  }

  auto field_schema(const ModelType& owner, const FieldDecl& field) -> Expected<Json> {
    Json schema = Json::object();
    if (field.model) {
      auto nested = catalog_.lookup(*field.model);
      if (!nested) {
        return tl::unexpected(make_error(ErrorCode::UnknownType,
                                         "field '" + owner.name + "." + field.name +
                                           "' refers to undefined type " +
                                           std::to_string(*field.model),
                                         owner.name));
      }
      const auto key = def_key(*nested);
      if (visited_.insert(nested->id).second) {
        auto nested_schema = build_model(*nested);
        if (!nested_schema) {
          return nested_schema;
        }
        defs_[key] = std::move(*nested_schema);
      }
      schema["$ref"] = "#/$defs/" + key;
    } else if (mode_ == SchemaMode::Validation && field.validation_schema) {
      schema = *field.validation_schema;
    } else {
      schema = field.schema;
    }

    if (!schema.is_object()) {
      return tl::unexpected(make_error(ErrorCode::Provider,
                                       "schema of field '" + owner.name + "." + field.name +
                                         "' must be a JSON object",
                                       owner.name));
    }
    if (field.default_value) {
      schema["default"] = *field.default_value;
    }
    if (field.description) {
      schema["description"] = *field.description;
    }
    schema["title"] = field_title(field.name);
    return schema;
  }

  auto build_model(const ModelType& type) -> Expected<Json> {
    Json properties = Json::object();
    Json required = Json::array();
    for (const auto& field : type.fields) {
      auto schema = field_schema(type, field);
      if (!schema) {
        return schema;
      }
      const auto& key = property_key(field);
      properties[key] = std::move(*schema);
      if (!field.default_value) {
        required.push_back(key);
      }
    }

    Json model = Json::object();
    if (type.doc) {
      model["description"] = *type.doc;
    }
    model["properties"] = std::move(properties);
    if (!required.empty()) {
      model["required"] = std::move(required);
    }
    model["title"] = type.name;
    model["type"] = "object";
    return model;
  }

  const TypeCatalog& catalog_;
  SchemaMode mode_;
  Aliasing aliasing_;
  std::unordered_set<TypeId> visited_;
  std::unordered_map<TypeId, std::string> def_keys_;
  std::unordered_set<std::string> taken_keys_;
  Json defs_ = Json::object();
};

}  // namespace

FieldSchemaProvider::FieldSchemaProvider(const TypeCatalog* catalog) : catalog_(catalog) {}

auto FieldSchemaProvider::generate(const ModelType& type, SchemaMode mode, Aliasing aliasing) const
  -> Expected<Json> {
  SchemaBuilder builder(*catalog_, mode, aliasing);
  return builder.build_root(type);
}

auto field_title(std::string_view name) -> std::string {
  std::string title;
  title.reserve(name.size());
  bool word_start = true;
  for (char c : name) {
    if (c == '_') {
      title.push_back(' ');
      word_start = true;
      continue;
    }
    auto uc = static_cast<unsigned char>(c);
    title.push_back(word_start ? static_cast<char>(std::toupper(uc))
                               : static_cast<char>(std::tolower(uc)));
    word_start = false;
  }
  return title;
}

}  // namespace sid::identity
