#pragma once

#include <string>
#include <utility>

#include "identity/identity_registry.hpp"

namespace sid::identity {

/// A record tagged with the identity hash of the schema that produced it.
template <typename T>
struct Stamped {
  TypeId type = 0;
  T value;
  std::string schema_hash;
};

/// Tag `value` with the current hash of `type` unless `schema_hash` is given.
template <typename T>
auto stamp(IdentityRegistry& registry, TypeId type, T value, std::string schema_hash = {})
  -> Expected<Stamped<T>> {
  if (schema_hash.empty()) {
    auto hash = registry.get_or_create(type);
    if (!hash) {
      return tl::unexpected(hash.error());
    }
    schema_hash = std::move(*hash);
  }
  return Stamped<T>{type, std::move(value), std::move(schema_hash)};
}

/// Whether the record was produced by the schema `type` has right now.
template <typename T>
auto is_current(IdentityRegistry& registry, const Stamped<T>& record) -> Expected<bool> {
  auto hash = registry.get_or_create(record.type);
  if (!hash) {
    return tl::unexpected(hash.error());
  }
  return *hash == record.schema_hash;
}

}  // namespace sid::identity
