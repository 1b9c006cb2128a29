#pragma once

#include <cstdint>
#include <functional>

namespace relay::collab {

// (bytes_done, bytes_total, bytes_per_second). bytes_total may be 0 when unknown.
using ProgressFn = std::function<void(uint64_t, uint64_t, double)>;

} // namespace relay::collab
