#include "identity/fullname.hpp"

#include <filesystem>
#include <vector>

namespace sid::identity {

auto PathFullnameResolver::resolve(const ModelType& type, int keep_path_parts) const
  -> std::string {
  return qualified_name(type.declaring_file, type.name, keep_path_parts);
}

auto qualified_name(std::string_view declaring_file, std::string_view name, int keep_path_parts)
  -> std::string {
  if (keep_path_parts <= 0 || declaring_file.empty()) {
    return std::string(name);
  }

  const auto path = std::filesystem::path{std::string(declaring_file)}.lexically_normal();
  std::vector<std::string> segments;
  for (const auto& part : path.relative_path()) {
    auto text = part.string();
    if (!text.empty() && text != "." && text != "..") {
      segments.push_back(std::move(text));
    }
  }
  if (!segments.empty()) {
    segments.back() = std::filesystem::path(segments.back()).stem().string();
  }

  const auto keep = static_cast<std::size_t>(keep_path_parts);
  const auto first = segments.size() > keep ? segments.size() - keep : 0;

  std::string out;
  for (auto i = first; i < segments.size(); ++i) {
    out += segments[i];
    out += '.';
  }
  out += name;
  return out;
}

}  // namespace sid::identity
