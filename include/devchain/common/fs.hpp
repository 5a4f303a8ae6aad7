#pragma once

#include "devchain/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace devchain::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace devchain::common
