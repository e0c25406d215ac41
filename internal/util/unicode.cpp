#include "unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace pef::util {

namespace {

const icu::Normalizer2& Nfc() {
  UErrorCode              status = U_ZERO_ERROR;
  const icu::Normalizer2* nfc    = icu::Normalizer2::getNFCInstance(status);
  if (U_FAILURE(status) || nfc == nullptr) {
    throw ConfigurationError(std::string("unicode normalization data unavailable: ") + u_errorName(status));
  }
  return *nfc;
}

} // namespace

std::string ToNfc(const std::string& text) {
  if (std::all_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; })) {
    return text;
  }

  const auto input = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

  // invalid sequences come back as U+FFFD
  std::string decoded;
  input.toUTF8String(decoded);
  if (decoded != text) {
    return text;
  }

  const auto& nfc    = Nfc();
  UErrorCode  status = U_ZERO_ERROR;
  if (nfc.isNormalized(input, status) && U_SUCCESS(status)) {
    return text;
  }

  status                = U_ZERO_ERROR;
  const auto normalized = nfc.normalize(input, status);
  if (U_FAILURE(status)) {
    throw ConfigurationError(std::string("unicode normalization failed: ") + u_errorName(status));
  }

  std::string out;
  normalized.toUTF8String(out);
  return out;
}

} // namespace pef::util
