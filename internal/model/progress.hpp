#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace pef::model {

// (current, total, message). total == 0 means the total is not known yet.
using ProgressCallback = std::function<void(std::uint64_t current, std::uint64_t total, std::string_view message)>;

inline void Report(const ProgressCallback& cb, std::uint64_t current, std::uint64_t total, std::string_view message) {
  if (cb) {
    cb(current, total, message);
  }
}

} // namespace pef::model
