#include "state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace pef::state {

namespace fs = std::filesystem;

using pef::state::v1::Fingerprint;
using pef::state::v1::ProcessingState;
using pef::util::StateError;

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime  = 1099511628211ULL;

void Mix(std::uint64_t* hash, const std::string& value) {
  for (unsigned char c : value) {
    *hash ^= c;
    *hash *= kFnvPrime;
  }
  // field separator, so ("ab","c") and ("a","bc") differ
  *hash ^= 0x1f;
  *hash *= kFnvPrime;
}

} // namespace

Fingerprint MakeFingerprint(const fs::path& source, const fs::path& dest, const std::vector<std::string>& suffixes) {
  Fingerprint fp;
  fp.set_source_path(source.string());
  fp.set_dest_path(dest.string());

  std::uint64_t hash = kFnvOffset;
  Mix(&hash, fp.source_path());
  Mix(&hash, fp.dest_path());
  Mix(&hash, std::to_string(suffixes.size()));
  for (const auto& suffix : suffixes) {
    fp.add_suffixes(suffix);
    Mix(&hash, suffix);
  }

  std::ostringstream hex;
  hex << std::hex << std::setw(16) << std::setfill('0') << hash;
  fp.set_digest(hex.str());
  return fp;
}

bool SameConfiguration(const Fingerprint& a, const Fingerprint& b) {
  return !a.digest().empty() && a.digest() == b.digest();
}

StateStore::StateStore(fs::path dest_dir) : dest_dir_(std::move(dest_dir)) {
}

fs::path StateStore::Dir() const {
  return dest_dir_ / kStateDirName;
}

fs::path StateStore::Path() const {
  return Dir() / kStateFileName;
}

bool StateStore::Exists() const {
  std::error_code ec;
  return fs::is_regular_file(Path(), ec);
}

std::optional<ProcessingState> StateStore::Load() const {
  if (!Exists()) {
    return std::nullopt;
  }

  std::ifstream in(Path(), std::ios::binary);
  if (!in) {
    throw StateError("cannot open state file: " + Path().string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  ProcessingState state;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &state, options);
  if (!status.ok()) {
    throw StateError("corrupt state file " + Path().string() + ": " + std::string(status.message()));
  }
  return state;
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void StateStore::Save(const ProcessingState& state) const {
  std::error_code ec;
  fs::create_directories(Dir(), ec);
  if (ec) {
    throw StateError("cannot create state directory " + Dir().string() + ": " + ec.message());
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(state, &json, options);
  if (!status.ok()) {
    throw StateError("cannot encode state: " + std::string(status.message()));
  }

  const auto final_path = Path();
  const auto tmp_path   = fs::path(final_path.string() + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    out << json;
    out.flush();
    if (!out) {
      throw StateError("cannot write state file: " + tmp_path.string());
    }
  }

  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    throw StateError("cannot replace state file " + final_path.string() + ": " + ec.message());
  }
}

void StateStore::Remove() const {
  std::error_code ec;
  fs::remove(Path(), ec);
}

} // namespace pef::state
