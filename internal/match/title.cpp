#include "title.hpp"

#include <cctype>

#include "internal/util/unicode.hpp"

namespace pef::match {

namespace {

constexpr std::string_view kSidecarTail = ".json";

} // namespace

std::string ParsedTitle::BuildFilename(std::string_view suffix) const {
  std::string out;
  out.reserve(base.size() + suffix.size() + duplicate_marker.size() + extension.size());
  out.append(base);
  out.append(suffix);
  out.append(duplicate_marker);
  out.append(extension);
  return out;
}

std::pair<std::string, std::string> SplitExtension(const std::string& filename) {
  const auto dot = filename.rfind('.');
  if (dot == std::string::npos) {
    return {filename, {}};
  }

  bool only_dots_before = true;
  for (std::size_t i = 0; i < dot; ++i) {
    if (filename[i] != '.') {
      only_dots_before = false;
      break;
    }
  }
  if (only_dots_before) {
    return {filename, {}};
  }

  return {filename.substr(0, dot), filename.substr(dot)};
}

std::string TruncateBase(const std::string& base, const std::string& extension) {
  if (base.size() + extension.size() <= kMaxFilenameBytes) {
    return base;
  }
  if (extension.size() >= kMaxFilenameBytes) {
    return {};
  }
  // Byte cut, not code point cut: the export counts encoded bytes too.
  return base.substr(0, kMaxFilenameBytes - extension.size());
}

std::optional<int> DuplicateIndex(const std::filesystem::path& sidecar_path) {
  const std::string name = sidecar_path.filename().string();
  if (name.size() < kSidecarTail.size() + 3) {
    return std::nullopt;
  }
  if (name.compare(name.size() - kSidecarTail.size(), kSidecarTail.size(), kSidecarTail) != 0) {
    return std::nullopt;
  }

  const std::size_t close = name.size() - kSidecarTail.size() - 1;
  if (name[close] != ')') {
    return std::nullopt;
  }

  const auto open = name.rfind('(', close);
  if (open == std::string::npos) {
    return std::nullopt;
  }

  const std::string digits = name.substr(open + 1, close - open - 1);
  if (digits.empty() || digits.size() > 3 || digits[0] == '0') {
    return std::nullopt;
  }
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }

  const int value = std::stoi(digits);
  if (value < 1 || value > kMaxDuplicateIndex) {
    return std::nullopt;
  }
  return value;
}

ParsedTitle ParseTitle(const std::string& title, const std::filesystem::path& sidecar_path) {
  // truncation counts bytes of the composed form
  auto [base, extension] = SplitExtension(util::ToNfc(title));

  ParsedTitle parsed;
  parsed.base      = TruncateBase(base, extension);
  parsed.extension = std::move(extension);

  if (const auto index = DuplicateIndex(sidecar_path)) {
    parsed.duplicate_marker = "(" + std::to_string(*index) + ")";
  }
  return parsed;
}

} // namespace pef::match
