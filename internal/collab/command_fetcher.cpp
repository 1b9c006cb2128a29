#include "command_fetcher.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

extern char** environ;

namespace relay::collab {

namespace {

constexpr const char* kProgressPrefix = "RELAY-PROGRESS ";

// downloaded total estimate speed; yt-dlp prints NA for unknown values
constexpr const char* kProgressTemplate =
    "download:RELAY-PROGRESS %(progress.downloaded_bytes)s %(progress.total_bytes)s %(progress.total_bytes_estimate)s %(progress.speed)s";

std::optional<double> ParseNumber(const std::string& token) {
  if (token.empty() || token == "NA" || token == "None") return std::nullopt;
  char*        end   = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (!end || *end != '\0') return std::nullopt;
  return value;
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

// Owns both ends of a pipe until they are handed off.
class Pipe {
 public:
  Pipe() {
    if (::pipe(fds_) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe");
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReadEnd() const {
    return fds_[0];
  }
  int WriteEnd() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

class FileActions {
 public:
  FileActions() {
    posix_spawn_file_actions_init(&actions_);
  }
  ~FileActions() {
    posix_spawn_file_actions_destroy(&actions_);
  }

  FileActions(const FileActions&)            = delete;
  FileActions& operator=(const FileActions&) = delete;

  posix_spawn_file_actions_t* Get() {
    return &actions_;
  }

 private:
  posix_spawn_file_actions_t actions_;
};

} // namespace

CommandFetcher::CommandFetcher(CommandFetcherOptions options) : options_(std::move(options)) {
}

std::string CommandFetcher::FormatSelector(const std::string& quality) {
  if (quality == "best") return "bestvideo+bestaudio/best";
  if (quality == "1080p") return "bestvideo[height<=1080]+bestaudio/best[height<=1080]/best";
  if (quality == "720p") return "bestvideo[height<=720]+bestaudio/best[height<=720]/best";
  if (quality == "480p") return "bestvideo[height<=480]+bestaudio/best[height<=480]/best";
  return "best";
}

std::vector<std::string> CommandFetcher::BuildArgs(const FetchRequest& request) const {
  std::vector<std::string> args = {
      options_.program,
      "--newline",
      "--no-simulate",
      "--progress",
      "--progress-template",
      kProgressTemplate,
      "--print",
      "after_move:filepath",
      "--format",
      FormatSelector(options_.quality),
      "--merge-output-format",
      "mp4",
      "--output",
      request.destination_stem + ".%(ext)s",
  };
  args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());
  args.push_back(ReplaceAll(options_.url_template, "{id}", request.item_id));
  return args;
}

std::optional<CommandFetcher::ProgressLine> CommandFetcher::ParseProgressLine(const std::string& line) {
  const std::string prefix(kProgressPrefix);
  if (line.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

  std::istringstream in(line.substr(prefix.size()));
  std::string        downloaded, total, estimate, speed;
  in >> downloaded >> total >> estimate >> speed;

  const auto done = ParseNumber(downloaded);
  if (!done) return std::nullopt;

  ProgressLine out;
  out.bytes_done = static_cast<uint64_t>(*done);
  if (auto exact = ParseNumber(total)) {
    out.bytes_total = static_cast<uint64_t>(*exact);
  } else if (auto approx = ParseNumber(estimate)) {
    out.bytes_total = static_cast<uint64_t>(*approx);
  }
  out.rate = ParseNumber(speed).value_or(0.0);
  return out;
}

FetchResult CommandFetcher::Fetch(const FetchRequest& request, const ProgressFn& progress) {
  const auto args = BuildArgs(request);

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
  argv.push_back(nullptr);

  Pipe        output;
  FileActions actions;
  posix_spawn_file_actions_adddup2(actions.Get(), output.WriteEnd(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(actions.Get(), output.WriteEnd(), STDERR_FILENO);
  posix_spawn_file_actions_addclose(actions.Get(), output.ReadEnd());

  pid_t pid = 0;
  if (const int rc = posix_spawnp(&pid, options_.program.c_str(), actions.Get(), nullptr, argv.data(), environ); rc != 0) {
    throw std::runtime_error("failed to start " + options_.program + ": " + std::strerror(rc));
  }
  output.CloseWrite();

  std::string last_path;
  std::string last_error;
  std::string pending;
  char        buffer[4096];

  auto handle_line = [&](const std::string& raw) {
    const auto line = util::Trim(raw);
    if (line.empty()) return;

    if (auto parsed = ParseProgressLine(line)) {
      if (progress) progress(parsed->bytes_done, parsed->bytes_total, parsed->rate);
    } else if (line.rfind("ERROR:", 0) == 0) {
      last_error = line;
    } else if (line.front() == '/' || line.rfind(request.destination_stem, 0) == 0) {
      last_path = line;
    } else {
      RELAY_LOG_DEBUG("downloader output", {observability::StringField("item_id", request.item_id), observability::StringField("line", line)});
    }
  };

  while (true) {
    const ssize_t n = ::read(output.ReadEnd(), buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;

    pending.append(buffer, static_cast<std::size_t>(n));
    std::size_t newline;
    while ((newline = pending.find_first_of("\r\n")) != std::string::npos) {
      handle_line(pending.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }
  handle_line(pending);
  output.CloseRead();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    if (!last_error.empty()) throw std::runtime_error(last_error);
    if (WIFSIGNALED(status)) throw std::runtime_error(options_.program + " killed by signal " + std::to_string(WTERMSIG(status)));
    throw std::runtime_error(options_.program + " exited with status " + std::to_string(WEXITSTATUS(status)));
  }

  std::error_code ec;
  if (last_path.empty() || !std::filesystem::is_regular_file(last_path, ec)) {
    throw std::runtime_error("Download finished but output file not found");
  }

  FetchResult result;
  result.local_path = last_path;
  result.local_size = std::filesystem::file_size(last_path);
  return result;
}

} // namespace relay::collab
