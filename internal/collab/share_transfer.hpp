#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "transfer.hpp"

namespace relay::collab {

struct ShareTransferOptions {
  // Mount point of the remote share (SMB/NFS).
  std::filesystem::path share_root;
  std::string           standard_dir     = "videos";
  std::string           short_dir        = "shorts";
  uint64_t              chunk_size_bytes = 1024 * 1024;
};

/*
  Transfer into a mounted remote share.

  Copies in chunks to "<name>.part" and renames on completion, so a
  crashed transfer never leaves a full-looking object behind.
  remote_ref is the path relative to the share root.
*/
class ShareTransfer final : public Transfer {
 public:
  explicit ShareTransfer(ShareTransferOptions options);

  TransferResult Send(const std::string& local_path, const std::string& remote_name, bool short_form, const ProgressFn& progress) override;

  uint64_t RemoteSize(const std::string& remote_ref) override;

 private:
  ShareTransferOptions options_;
};

} // namespace relay::collab
