#pragma once

#include <cstdint>
#include <string>

#include "progress.hpp"

namespace relay::collab {

struct FetchRequest {
  std::string item_id;
  std::string title;
  // <download_dir>/<id>_<title>; the fetcher picks the extension.
  std::string destination_stem;
};

struct FetchResult {
  std::string local_path;
  uint64_t    local_size = 0;
};

/*
  Retrieves one item to local disk. Throws on failure; the message is
  persisted as the item's retrieval error.
*/
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual FetchResult Fetch(const FetchRequest& request, const ProgressFn& progress) = 0;
};

} // namespace relay::collab
