#pragma once

#include <string>
#include <string_view>

#include "identity/error.hpp"
#include "identity/schema_document.hpp"
#include "identity/type_catalog.hpp"

namespace sid::identity {

/// Produces the schema document of a type in the requested mode and aliasing.
class SchemaProvider {
 public:
  virtual ~SchemaProvider() = default;

  virtual auto generate(const ModelType& type, SchemaMode mode, Aliasing aliasing) const
    -> Expected<Json> = 0;
};

/// Builds a JSON-Schema-like object document from the declared fields.
/// Nested models are emitted once each under the root's `$defs`, keyed by name
/// (path-qualified when another nested type already uses that name).
class FieldSchemaProvider final : public SchemaProvider {
 public:
  /// `catalog` resolves nested models and must outlive the provider.
  explicit FieldSchemaProvider(const TypeCatalog* catalog = &TypeCatalog::global());

  auto generate(const ModelType& type, SchemaMode mode, Aliasing aliasing) const
    -> Expected<Json> override;

 private:
  const TypeCatalog* catalog_;
};

/// "field_name" -> "Field Name".
auto field_title(std::string_view name) -> std::string;

}  // namespace sid::identity
