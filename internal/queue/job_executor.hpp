#pragma once

#include <cstdint>
#include <string>

namespace relay::queue {

/*
  Work performed by a pipeline worker for one dequeued item.

  Execute runs on the worker's own thread. Implementations persist the
  outcome themselves; anything thrown is logged by the pool and dropped.
*/
class JobExecutor {
 public:
  virtual ~JobExecutor() = default;

  virtual void Execute(uint32_t slot, const std::string& item_id) = 0;
};

} // namespace relay::queue
