#include "identity/type_catalog.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace sid::identity {
namespace {

auto merge_fields(const std::vector<FieldDecl>& inherited, std::vector<FieldDecl> declared)
  -> std::vector<FieldDecl> {
  std::vector<FieldDecl> merged = inherited;
  for (auto& field : declared) {
    auto it = std::find_if(merged.begin(), merged.end(),
                           [&](const FieldDecl& existing) { return existing.name == field.name; });
    if (it != merged.end()) {
      *it = std::move(field);
    } else {
      merged.push_back(std::move(field));
    }
  }
  return merged;
}

}  // namespace

auto TypeCatalog::global() -> TypeCatalog& {
  static TypeCatalog catalog;
  return catalog;
}

auto TypeCatalog::define(ModelDef def, std::source_location location) -> Expected<TypeId> {
  std::unique_lock lock(mutex_);

  std::shared_ptr<const ModelType> base;
  if (def.base) {
    auto it = types_.find(*def.base);
    if (it == types_.end()) {
      return tl::unexpected(make_error(ErrorCode::UnknownType,
                                       "base type " + std::to_string(*def.base) + " of '" +
                                         def.name + "' is not defined",
                                       def.name));
    }
    base = it->second;
  }
  for (const auto& field : def.fields) {
    if (field.model && !types_.contains(*field.model)) {
      return tl::unexpected(make_error(ErrorCode::UnknownType,
                                       "field '" + def.name + "." + field.name +
                                         "' refers to undefined type " +
                                         std::to_string(*field.model),
                                       def.name));
    }
  }

  auto model = std::make_shared<ModelType>();
  model->id = next_id_++;
  model->name = std::move(def.name);
  model->declaring_file =
    def.declaring_file.empty() ? std::string(location.file_name()) : std::move(def.declaring_file);
  model->base = def.base;
  model->doc = std::move(def.doc);
  if (base) {
    model->fields = merge_fields(base->fields, std::move(def.fields));
    model->config = resolve_config(base->config, def.hash_config);
    model->schema_mode_override = def.schema_mode_override ? def.schema_mode_override
                                                           : base->schema_mode_override;
  } else {
    model->fields = std::move(def.fields);
    model->config = resolve_config(HashConfig{}, def.hash_config);
    model->schema_mode_override = def.schema_mode_override;
  }

  auto id = model->id;
  types_.emplace(id, std::move(model));
  return id;
}

auto TypeCatalog::lookup(TypeId id) const -> std::shared_ptr<const ModelType> {
  std::shared_lock lock(mutex_);
  auto it = types_.find(id);
  if (it == types_.end()) {
    return nullptr;
  }
  return it->second;
}

auto TypeCatalog::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return types_.size();
}

}  // namespace sid::identity
