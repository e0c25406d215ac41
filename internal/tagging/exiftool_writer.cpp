#include "exiftool_writer.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"

namespace pef::tagging {

using observability::IntField;
using observability::StringField;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(5);

} // namespace

ExifToolTagWriter::ExifToolTagWriter(std::string executable, std::chrono::milliseconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {
}

bool ExifToolTagWriter::Available() const {
  return Run({"-ver"}) == 0;
}

std::vector<std::string> ExifToolTagWriter::BuildArguments(const std::filesystem::path& file, const metadata::TagMap& tags) {
  std::vector<std::string> args = {"-overwrite_original", "-m", "-P", "-charset", "filename=utf8"};
  for (const auto& [tag, values] : tags) {
    for (const auto& value : values) {
      args.push_back("-" + tag + "=" + value);
    }
  }
  args.push_back(file.string());
  return args;
}

bool ExifToolTagWriter::WriteTags(const std::filesystem::path& file, const metadata::TagMap& tags) {
  if (tags.empty()) {
    return true;
  }

  const int status = Run(BuildArguments(file, tags));
  if (status != 0) {
    PEF_LOG_DEBUG("exiftool write failed", {StringField("path", file.string()), IntField("status", status)});
    return false;
  }
  return true;
}

int ExifToolTagWriter::Run(const std::vector<std::string>& args) const {
  std::vector<std::string> owned;
  owned.reserve(args.size() + 1);
  owned.push_back(executable_);
  owned.insert(owned.end(), args.begin(), args.end());

  std::vector<char*> argv;
  argv.reserve(owned.size() + 1);
  for (auto& arg : owned) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    PEF_LOG_WARN("fork failed", {StringField("error", std::strerror(errno))});
    return -1;
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  int        status   = 0;
  for (;;) {
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0 && errno != EINTR) {
      return -1;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      PEF_LOG_WARN("exiftool timed out", {IntField("timeout_ms", timeout_.count())});
      return -1;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    return code == 127 ? -1 : code;
  }
  return -1;
}

} // namespace pef::tagging
