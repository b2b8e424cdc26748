#pragma once

#include "cairn/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

namespace cairn::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// True when any component of the lexical path is "..".
[[nodiscard]] bool has_parent_traversal(const std::filesystem::path &path);

/// Reads a whole regular file. Fails with std::errc::file_too_large when the file is
/// bigger than max_bytes, without reading the body.
[[nodiscard]] Result<std::string, std::error_code> read_file_capped(const std::filesystem::path &path,
                                                                   std::size_t max_bytes);

} // namespace cairn::common
