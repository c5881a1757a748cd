#include "identity/report.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sid::identity {

auto settings_to_json(const HashSettings& settings) -> Json {
  Json json = Json::object();
  json["track_descriptions"] = settings.track_descriptions;
  json["track_field_order"] = settings.track_field_order;
  json["track_type_order"] = settings.track_type_order;
  json["tracked_filepath_parts"] = settings.tracked_filepath_parts;
  json["track_validation_mode"] = settings.track_validation_mode;
  return json;
}

auto report_to_json(const IdentityReport& report) -> Json {
  Json json = Json::object();
  json["fullname"] = report.fullname;
  json["date"] = format_timestamp(report.created_at);
  json["hash"] = report.hash;
  json["hash_settings"] = settings_to_json(report.hash_settings);
  return json;
}

auto format_timestamp(std::chrono::system_clock::time_point time) -> std::string {
  const auto whole = std::chrono::time_point_cast<std::chrono::seconds>(time);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time - whole).count();
  const std::time_t raw = std::chrono::system_clock::to_time_t(whole);

  std::tm utc{};
  gmtime_r(&raw, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
      << micros << "+00:00";
  return out.str();
}

}  // namespace sid::identity
