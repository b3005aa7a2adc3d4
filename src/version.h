#pragma once

#include <spdlog/fmt/fmt.h>

#include <string>

namespace panewm {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 1;
constexpr const char* VERSION_LABEL = "alpha"; // Empty for releases

inline std::string get_version_string() {
  if (VERSION_LABEL[0] == '\0') {
    return fmt::format("{}.{}.{}", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
  }
  return fmt::format("{}.{}.{}-{}", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH, VERSION_LABEL);
}

} // namespace panewm
