#pragma once

#include <string>

#include "internal/db/model/item_record.hpp"

namespace relay::pipeline {

// Routes items onto pipeline queues.
class JobDispatcher {
 public:
  virtual ~JobDispatcher() = default;

  // Picks the short or standard queue from the item's duration.
  virtual void DispatchRetrieval(const db::model::ItemRecord& record) = 0;

  virtual void DispatchRelay(const std::string& item_id) = 0;
};

} // namespace relay::pipeline
