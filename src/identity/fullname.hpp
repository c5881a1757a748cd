#pragma once

#include <string>
#include <string_view>

#include "identity/type_catalog.hpp"

namespace sid::identity {

/// Produces the qualified name folded into the hash input and reports.
class FullnameResolver {
 public:
  virtual ~FullnameResolver() = default;

  virtual auto resolve(const ModelType& type, int keep_path_parts) const -> std::string = 0;
};

/// Name prefixed by up to `keep_path_parts` trailing segments of the declaring
/// file (extension removed), dot-joined: "models.records.Reading".
class PathFullnameResolver final : public FullnameResolver {
 public:
  auto resolve(const ModelType& type, int keep_path_parts) const -> std::string override;
};

auto qualified_name(std::string_view declaring_file, std::string_view name, int keep_path_parts)
  -> std::string;

}  // namespace sid::identity
