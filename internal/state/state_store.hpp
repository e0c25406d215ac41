#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pef/state/v1/state.pb.h"

namespace pef::state {

inline constexpr char          kStateDirName[]  = "_pef";
inline constexpr char          kStateFileName[] = "processing_state.json";
inline constexpr std::uint32_t kStateVersion    = 2;

/*
  Configuration fingerprint of a run.

  The digest covers source, destination and the ordered suffix list; any
  difference between two runs is configuration drift and rules out resume.
*/
pef::state::v1::Fingerprint MakeFingerprint(const std::filesystem::path& source, const std::filesystem::path& dest,
                                            const std::vector<std::string>& suffixes);

// Fingerprints without a digest never match anything.
bool SameConfiguration(const pef::state::v1::Fingerprint& a, const pef::state::v1::Fingerprint& b);

/*
  <dest>/_pef/processing_state.json, stored as the JSON form of
  ProcessingState. Writes go to a temporary file that is renamed over the
  previous state, so a crash leaves either the old or the new state.
*/
class StateStore {
 public:
  explicit StateStore(std::filesystem::path dest_dir);

  std::filesystem::path Dir() const;
  std::filesystem::path Path() const;

  bool Exists() const;

  // std::nullopt when there is no state file. Throws StateError when the
  // file exists but cannot be read or decoded.
  std::optional<pef::state::v1::ProcessingState> Load() const;

  // Throws StateError on I/O failure.
  void Save(const pef::state::v1::ProcessingState& state) const;

  void Remove() const;

 private:
  std::filesystem::path dest_dir_;
};

} // namespace pef::state
