#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "identity/identity_registry.hpp"
#include "identity/model_json.hpp"
#include "identity/type_catalog.hpp"

DEFINE_string(models, "", "Path to a JSON file with {\"models\": [...]} definitions");
DEFINE_bool(show_input, false, "Also print the hash input envelope of each model");
DEFINE_bool(rebuild, false, "Rebuild each hash before printing its report");

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Print schema identity reports for JSON model definitions");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sid::log::init();

  if (FLAGS_models.empty()) {
    std::cerr << "--models is required\n";
    return 2;
  }

  sid::identity::Json json;
  try {
    std::ifstream file(FLAGS_models);
    if (!file) {
      std::cerr << "Failed to open " << FLAGS_models << "\n";
      return 1;
    }
    json = sid::identity::Json::parse(file);
  } catch (const std::exception& ex) {
    std::cerr << "Failed to parse " << FLAGS_models << ": " << ex.what() << "\n";
    return 1;
  }

  auto& catalog = sid::identity::TypeCatalog::global();
  auto ids = sid::identity::load_models_json(json, catalog, FLAGS_models);
  if (!ids) {
    std::cerr << "Definition error: " << ids.error().message << "\n";
    return 1;
  }
  sid::log::info("models_loaded", {{"file", FLAGS_models}, {"count", std::to_string(ids->size())}});

  auto& registry = sid::identity::IdentityRegistry::global();
  int failures = 0;
  for (auto id : *ids) {
    if (FLAGS_rebuild) {
      auto rebuilt = registry.rebuild(id);
      if (!rebuilt) {
        std::cerr << "Rebuild error: " << rebuilt.error().message << "\n";
        ++failures;
        continue;
      }
    }

    auto report = registry.report(id);
    if (!report) {
      const auto& error = report.error();
      std::cerr << "[" << sid::identity::to_string(error.code) << "] " << error.message;
      if (!error.cause.empty()) {
        std::cerr << " (" << error.cause << ")";
      }
      std::cerr << "\n";
      ++failures;
      continue;
    }
    std::cout << sid::identity::report_to_json(*report).dump(2) << "\n";

    if (FLAGS_show_input) {
      auto input = registry.hash_input(id);
      if (!input) {
        std::cerr << "Hash input error: " << input.error().message << "\n";
        ++failures;
        continue;
      }
      std::cout << *input << "\n";
    }
  }

  sid::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return failures == 0 ? 0 : 1;
}
