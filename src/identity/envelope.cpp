#include "identity/envelope.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace sid::identity {

auto envelope_schemas(const HashEnvelope& envelope) -> Json {
  Json schemas = Json::object();
  schemas["ser_by_alias"] = envelope.ser_by_alias;
  schemas["ser_by_name"] = envelope.ser_by_name;
  if (envelope.val_by_alias) {
    schemas["val_by_alias"] = *envelope.val_by_alias;
  }
  return schemas;
}

auto envelope_to_json(const HashEnvelope& envelope) -> Json {
  Json json = Json::object();
  json["name"] = envelope.name;
  json["schemas"] = envelope_schemas(envelope);
  json["extra_data"] = envelope.extra_data;
  return json;
}

auto sort_keys(const Json& value) -> Json {
  if (value.is_object()) {
    std::vector<std::string> keys;
    keys.reserve(value.size());
    for (auto it = value.begin(); it != value.end(); ++it) {
      keys.push_back(it.key());
    }
    std::sort(keys.begin(), keys.end());

    Json out = Json::object();
    for (const auto& key : keys) {
      out[key] = sort_keys(value.at(key));
    }
    return out;
  }
  if (value.is_array()) {
    Json out = Json::array();
    for (const auto& element : value) {
      out.push_back(sort_keys(element));
    }
    return out;
  }
  return value;
}

auto serialize_envelope(const HashEnvelope& envelope, bool sort_object_keys,
                        std::string_view type_name) -> Expected<std::string> {
  auto json = envelope_to_json(envelope);
  try {
    if (sort_object_keys) {
      return sort_keys(json).dump();
    }
    return json.dump();
  } catch (const Json::exception& ex) {
    return tl::unexpected(make_error(ErrorCode::Serialization,
                                     "the schema data for '" + std::string(type_name) +
                                       "' failed JSON serialization, so the schema hash can't "
                                       "be computed",
                                     std::string(type_name), ex.what()));
  }
}

}  // namespace sid::identity
