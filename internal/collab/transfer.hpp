#pragma once

#include <cstdint>
#include <string>

#include "progress.hpp"

namespace relay::collab {

struct TransferResult {
  std::string remote_ref;
};

/*
  Moves a local file to the remote storage target. Throws on failure.
*/
class Transfer {
 public:
  virtual ~Transfer() = default;

  virtual TransferResult Send(const std::string& local_path, const std::string& remote_name, bool short_form,
                              const ProgressFn& progress) = 0;

  // Size of the stored object, used to verify a finished transfer.
  virtual uint64_t RemoteSize(const std::string& remote_ref) = 0;
};

} // namespace relay::collab
