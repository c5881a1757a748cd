#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <unordered_map>
#include <vector>

#include "identity/error.hpp"
#include "identity/hash_config.hpp"
#include "identity/schema_document.hpp"

namespace sid::identity {

/// One declared field of a model type.
struct FieldDecl {
  std::string name;
  /// JSON-schema fragment describing the field in serialization mode.
  Json schema = Json::object();
  /// Fragment used in validation mode when the accepted input differs.
  std::optional<Json> validation_schema;
  std::optional<std::string> alias;
  /// Validation-mode alias; falls back to `alias`.
  std::optional<std::string> validation_alias;
  std::optional<std::string> description;
  /// Default value. A field without one is required.
  std::optional<Json> default_value;
  /// Nested model the field holds; `schema` is ignored when set.
  std::optional<TypeId> model;
};

struct ModelDef {
  std::string name;
  std::optional<TypeId> base;
  std::optional<std::string> doc;
  std::vector<FieldDecl> fields;
  HashConfigOverrides hash_config;
  std::optional<SchemaMode> schema_mode_override;
  /// Declaring file; the caller's source file is recorded when empty.
  std::string declaring_file;
};

/// Immutable, fully merged view of a defined type.
struct ModelType {
  TypeId id = 0;
  std::string name;
  std::string declaring_file;
  std::optional<TypeId> base;
  std::optional<std::string> doc;
  std::vector<FieldDecl> fields;
  HashConfig config;
  std::optional<SchemaMode> schema_mode_override;
};

/// Assigns type identities and resolves configuration at definition time.
class TypeCatalog {
 public:
  /// Process-wide catalog.
  static auto global() -> TypeCatalog&;

  auto define(ModelDef def, std::source_location location = std::source_location::current())
    -> Expected<TypeId>;
  auto lookup(TypeId id) const -> std::shared_ptr<const ModelType>;
  auto size() const -> std::size_t;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<TypeId, std::shared_ptr<const ModelType>> types_;
  TypeId next_id_ = 1;
};

}  // namespace sid::identity
