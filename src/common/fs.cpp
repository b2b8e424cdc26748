#include "cairn/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>

namespace cairn::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool has_parent_traversal(const std::filesystem::path &path) {
  return std::any_of(path.begin(), path.end(),
                     [](const std::filesystem::path &part) { return part == ".."; });
}

Result<std::string, std::error_code> read_file_capped(const std::filesystem::path &path,
                                                      const std::size_t max_bytes) {
  using R = Result<std::string, std::error_code>;

  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec) {
    return R::failure(ec);
  }
  if (!std::filesystem::is_regular_file(status)) {
    return R::failure(std::make_error_code(std::errc::invalid_argument));
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return R::failure(ec);
  }
  if (size > max_bytes) {
    return R::failure(std::make_error_code(std::errc::file_too_large));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno != 0 ? errno : EIO;
    return R::failure(std::error_code(err, std::generic_category()));
  }

  // The file may grow between the size check and the read; cap the read itself too.
  std::string content;
  content.reserve(static_cast<std::size_t>(size));
  std::istreambuf_iterator<char> it(in);
  const std::istreambuf_iterator<char> end;
  for (; it != end; ++it) {
    if (content.size() >= max_bytes) {
      return R::failure(std::make_error_code(std::errc::file_too_large));
    }
    content.push_back(*it);
  }
  if (in.bad()) {
    return R::failure(std::make_error_code(std::errc::io_error));
  }
  return R::success(std::move(content));
}

} // namespace cairn::common
