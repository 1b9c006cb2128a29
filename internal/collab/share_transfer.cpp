#include "share_transfer.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace relay::collab {

ShareTransfer::ShareTransfer(ShareTransferOptions options) : options_(std::move(options)) {
  if (options_.chunk_size_bytes == 0) {
    options_.chunk_size_bytes = 1024 * 1024;
  }
}

TransferResult ShareTransfer::Send(const std::string& local_path, const std::string& remote_name, bool short_form,
                                   const ProgressFn& progress) {
  if (options_.share_root.empty()) {
    throw std::runtime_error("relay share root is not configured");
  }

  const std::filesystem::path relative = std::filesystem::path(short_form ? options_.short_dir : options_.standard_dir) / remote_name;
  const auto                  target   = options_.share_root / relative;
  auto                        partial  = target;
  partial += ".part";

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("cannot create remote directory " + target.parent_path().string() + ": " + ec.message());
  }

  std::ifstream in(local_path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + local_path);
  }
  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open remote file " + partial.string());
  }

  const uint64_t total   = std::filesystem::file_size(local_path);
  uint64_t       written = 0;
  const auto     started = std::chrono::steady_clock::now();

  std::vector<char> buffer(options_.chunk_size_bytes);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto n = in.gcount();
    if (n <= 0) break;

    out.write(buffer.data(), n);
    if (!out) {
      throw std::runtime_error("write to " + partial.string() + " failed");
    }
    written += static_cast<uint64_t>(n);

    if (progress) {
      const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
      progress(written, total, seconds > 0 ? static_cast<double>(written) / seconds : 0.0);
    }
  }
  if (in.bad()) {
    throw std::runtime_error("read from " + local_path + " failed");
  }

  out.close();
  if (!out) {
    throw std::runtime_error("closing " + partial.string() + " failed");
  }

  std::filesystem::rename(partial, target, ec);
  if (ec) {
    std::filesystem::remove(partial, ec);
    throw std::runtime_error("cannot finalize remote file " + target.string());
  }

  return TransferResult{relative.generic_string()};
}

uint64_t ShareTransfer::RemoteSize(const std::string& remote_ref) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(options_.share_root / remote_ref, ec);
  if (ec) {
    throw std::runtime_error("cannot stat remote file " + remote_ref + ": " + ec.message());
  }
  return size;
}

} // namespace relay::collab
