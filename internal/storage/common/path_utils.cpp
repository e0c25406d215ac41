#include "path_utils.hpp"

#include <cstdlib>
#include <system_error>

#include "internal/util/errors.hpp"

namespace pef::storage::common {

namespace fs = std::filesystem;

fs::path UniquePath(const fs::path& path, bool is_dir) {
  std::error_code ec;
  if (is_dir) {
    if (!fs::exists(path, ec)) {
      return path;
    }
    for (unsigned n = 1;; ++n) {
      fs::path candidate = path.string() + "(" + std::to_string(n) + ")";
      if (!fs::exists(candidate, ec)) {
        return candidate;
      }
    }
  }

  if (!fs::exists(path, ec)) {
    return path;
  }

  const auto parent = path.parent_path();
  const auto stem   = path.stem().string();
  const auto ext    = path.extension().string();
  for (unsigned n = 1;; ++n) {
    auto candidate = parent / (stem + "(" + std::to_string(n) + ")" + ext);
    if (!fs::exists(candidate, ec)) {
      return candidate;
    }
  }
}

fs::path CheckoutDir(const fs::path& path, bool only_new) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    throw util::ConfigurationError("cannot create directory: " + path.string() + " exists as a file");
  }

  fs::path target = path;
  if (only_new) {
    target = UniquePath(path, true);
  }

  fs::create_directories(target, ec);
  if (ec) {
    throw util::ConfigurationError("cannot create directory " + target.string() + ": " + ec.message());
  }
  return target;
}

fs::path NormalizePath(const std::string& raw) {
  const auto first = raw.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = raw.find_last_not_of(" \t\r\n");
  std::string value = raw.substr(first, last - first + 1);

  if (!value.empty() && value[0] == '~' && (value.size() == 1 || value[1] == '/')) {
    if (const char* home = std::getenv("HOME")) {
      value = std::string(home) + value.substr(1);
    }
  }

  fs::path normal = fs::path(value).lexically_normal();
  auto     text   = normal.string();
  while (text.size() > 1 && text.back() == '/') {
    text.pop_back();
  }
  return fs::path(text);
}

bool IsWithin(const fs::path& child, const fs::path& parent) {
  const auto rel = child.lexically_normal().lexically_relative(parent.lexically_normal());
  if (rel.empty()) {
    return false;
  }
  const auto first = *rel.begin();
  return first != "..";
}

} // namespace pef::storage::common
