#include "identity/identity_registry.hpp"

#include <chrono>
#include <utility>

#include "common/logging/log.hpp"
#include "identity/canonicalize.hpp"
#include "identity/digest.hpp"

namespace sid::identity {
namespace {

auto log_failure(std::string_view operation, TypeId type, const IdentityError& error) -> void {
  sid::log::warn("{} failed type_id={} type={} code={}: {}", operation, type, error.type_name,
                 to_string(error.code), error.message);
}

}  // namespace

IdentityRegistry::IdentityRegistry(const TypeCatalog* catalog,
                                   std::shared_ptr<const SchemaProvider> provider,
                                   std::shared_ptr<const FullnameResolver> resolver)
    : catalog_(catalog),
      provider_(provider ? std::move(provider) : std::make_shared<FieldSchemaProvider>(catalog)),
      resolver_(resolver ? std::move(resolver) : std::make_shared<PathFullnameResolver>()) {}

auto IdentityRegistry::global() -> IdentityRegistry& {
  static IdentityRegistry registry(&TypeCatalog::global());
  return registry;
}

auto IdentityRegistry::get_or_create(TypeId type) -> Expected<std::string> {
  auto hash = hashes_.get_or_compute(type, [&] { return create_hash(type); });
  if (!hash) {
    log_failure("schema hash", type, hash.error());
  }
  return hash;
}

auto IdentityRegistry::rebuild(TypeId type) -> Expected<std::string> {
  hashes_.evict(type);
  reports_.evict(type);
  sid::log::info("rebuilding schema hash type_id={}", type);
  return get_or_create(type);
}

auto IdentityRegistry::report(TypeId type) -> Expected<IdentityReport> {
  auto result = reports_.get_or_compute(type, [&]() -> Expected<IdentityReport> {
    auto model = lookup(type);
    if (!model) {
      return tl::unexpected(model.error());
    }
    auto hash = get_or_create(type);
    if (!hash) {
      return tl::unexpected(hash.error());
    }
    IdentityReport report;
    report.fullname = resolver_->resolve(**model, (*model)->config.tracked_filepath_parts);
    report.created_at = std::chrono::system_clock::now();
    report.hash = std::move(*hash);
    report.hash_settings = hash_settings((*model)->config);
    sid::log::debug("identity report created type_id={} fullname={} hash={}", type,
                    report.fullname, report.hash);
    return report;
  });
  if (!result) {
    log_failure("identity report", type, result.error());
  }
  return result;
}

auto IdentityRegistry::fullname(TypeId type) const -> Expected<std::string> {
  auto model = lookup(type);
  if (!model) {
    return tl::unexpected(model.error());
  }
  return resolver_->resolve(**model, (*model)->config.tracked_filepath_parts);
}

auto IdentityRegistry::hash_input(TypeId type) const -> Expected<std::string> {
  auto model = lookup(type);
  if (!model) {
    return tl::unexpected(model.error());
  }
  return serialize(**model);
}

auto IdentityRegistry::build_envelope(TypeId type) const -> Expected<HashEnvelope> {
  auto model = lookup(type);
  if (!model) {
    return tl::unexpected(model.error());
  }
  return build_envelope(**model);
}

auto IdentityRegistry::has_hash(TypeId type) const -> bool {
  return hashes_.contains(type);
}

auto IdentityRegistry::has_report(TypeId type) const -> bool {
  return reports_.contains(type);
}

auto IdentityRegistry::lookup(TypeId type) const -> Expected<std::shared_ptr<const ModelType>> {
  auto model = catalog_->lookup(type);
  if (!model) {
    return tl::unexpected(
      make_error(ErrorCode::UnknownType, "type " + std::to_string(type) + " is not defined"));
  }
  return model;
}

auto IdentityRegistry::create_hash(TypeId type) const -> Expected<std::string> {
  auto model = lookup(type);
  if (!model) {
    return tl::unexpected(model.error());
  }
  auto bytes = serialize(**model);
  if (!bytes) {
    return tl::unexpected(bytes.error());
  }
  const auto& config = (*model)->config;
  auto hash = compute_identity_hash(*bytes, config.hash_function, config.hash_limit_length);
  sid::log::debug("schema hash computed type_id={} type={} hash={}", type, (*model)->name, hash);
  return hash;
}

auto IdentityRegistry::build_envelope(const ModelType& model) const -> Expected<HashEnvelope> {
  const auto& config = model.config;
  auto valid = validate_config(config, model.schema_mode_override, model.name);
  if (!valid) {
    return tl::unexpected(valid.error());
  }

  HashEnvelope envelope;
  auto ser_by_alias = provider_->generate(model, SchemaMode::Serialization, Aliasing::ByAlias);
  if (!ser_by_alias) {
    return tl::unexpected(ser_by_alias.error());
  }
  auto ser_by_name = provider_->generate(model, SchemaMode::Serialization, Aliasing::ByName);
  if (!ser_by_name) {
    return tl::unexpected(ser_by_name.error());
  }
  std::optional<Json> val_by_alias;
  if (config.track_validation_mode) {
    auto schema = provider_->generate(model, SchemaMode::Validation, Aliasing::ByAlias);
    if (!schema) {
      return tl::unexpected(schema.error());
    }
    val_by_alias = std::move(*schema);
  }

  const auto policy = canonical_policy(config);
  try {
    envelope.ser_by_alias = normalize(*ser_by_alias, policy);
    envelope.ser_by_name = normalize(*ser_by_name, policy);
    if (val_by_alias) {
      envelope.val_by_alias = normalize(*val_by_alias, policy);
    }
  } catch (const Json::exception& ex) {
    return tl::unexpected(make_error(ErrorCode::Serialization,
                                     "the schema of '" + model.name +
                                       "' could not be normalized",
                                     model.name, ex.what()));
  }

  envelope.name = resolver_->resolve(model, config.tracked_filepath_parts);
  envelope.extra_data = config.tracked_extra_data;
  return envelope;
}

auto IdentityRegistry::serialize(const ModelType& model) const -> Expected<std::string> {
  auto envelope = build_envelope(model);
  if (!envelope) {
    return tl::unexpected(envelope.error());
  }
  return serialize_envelope(*envelope, !model.config.track_field_order, envelope->name);
}

}  // namespace sid::identity
