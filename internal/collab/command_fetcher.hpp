#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fetcher.hpp"

namespace relay::collab {

struct CommandFetcherOptions {
  std::string              program = "yt-dlp";
  // best | 1080p | 720p | 480p
  std::string              quality = "best";
  std::vector<std::string> extra_args;
  // {id} is replaced with the item id
  std::string              url_template = "https://www.youtube.com/watch?v={id}";
};

/*
  Fetcher backed by an external downloader process (yt-dlp).

  stdout and stderr are merged into one pipe and parsed line by line:
  progress lines carry a fixed prefix, the final file path arrives via
  --print after_move:filepath, and the last "ERROR:" line becomes the
  failure message.
*/
class CommandFetcher final : public Fetcher {
 public:
  explicit CommandFetcher(CommandFetcherOptions options);

  FetchResult Fetch(const FetchRequest& request, const ProgressFn& progress) override;

  // Exposed for tests.
  static std::string              FormatSelector(const std::string& quality);
  std::vector<std::string>        BuildArgs(const FetchRequest& request) const;

  struct ProgressLine {
    uint64_t bytes_done  = 0;
    uint64_t bytes_total = 0;
    double   rate        = 0.0;
  };
  static std::optional<ProgressLine> ParseProgressLine(const std::string& line);

 private:
  CommandFetcherOptions options_;
};

} // namespace relay::collab
