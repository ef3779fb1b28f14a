#pragma once

#include "raefusion/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace raefusion::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &input);
[[nodiscard]] std::vector<std::string> split(const std::string &input, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] std::string now_rfc3339();

} // namespace raefusion::common
