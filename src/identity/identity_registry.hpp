#pragma once

#include <memory>
#include <string>

#include "identity/envelope.hpp"
#include "identity/error.hpp"
#include "identity/fullname.hpp"
#include "identity/identity_cache.hpp"
#include "identity/report.hpp"
#include "identity/schema_provider.hpp"
#include "identity/type_catalog.hpp"

namespace sid::identity {

/// Memoizes identity hashes and reports per type identity.
///
/// Entries are keyed by TypeId only: a subtype never sees its base type's
/// entry, and `rebuild` touches exactly one type.
class IdentityRegistry {
 public:
  /// `catalog` must outlive the registry.
  explicit IdentityRegistry(
    const TypeCatalog* catalog,
    std::shared_ptr<const SchemaProvider> provider = nullptr,
    std::shared_ptr<const FullnameResolver> resolver = nullptr);

  /// Registry over the global catalog with the bundled provider and resolver.
  static auto global() -> IdentityRegistry&;

  /// Cached identity hash, computed on first access.
  auto get_or_create(TypeId type) -> Expected<std::string>;
  /// Evict this type's hash and report, then compute the hash again.
  auto rebuild(TypeId type) -> Expected<std::string>;
  /// Cached identity report, built on first access.
  auto report(TypeId type) -> Expected<IdentityReport>;
  auto fullname(TypeId type) const -> Expected<std::string>;

  /// Exact bytes passed to the hash function. Not cached.
  auto hash_input(TypeId type) const -> Expected<std::string>;
  /// Envelope before serialization. Not cached.
  auto build_envelope(TypeId type) const -> Expected<HashEnvelope>;

  auto has_hash(TypeId type) const -> bool;
  auto has_report(TypeId type) const -> bool;

  auto catalog() const -> const TypeCatalog& { return *catalog_; }

 private:
  auto lookup(TypeId type) const -> Expected<std::shared_ptr<const ModelType>>;
  auto create_hash(TypeId type) const -> Expected<std::string>;
  auto build_envelope(const ModelType& model) const -> Expected<HashEnvelope>;
  auto serialize(const ModelType& model) const -> Expected<std::string>;

  const TypeCatalog* catalog_;
  std::shared_ptr<const SchemaProvider> provider_;
  std::shared_ptr<const FullnameResolver> resolver_;
  IdentityCache<std::string> hashes_;
  IdentityCache<IdentityReport> reports_;
};

}  // namespace sid::identity
