/* Copyright (c) 2018 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include "common/concurrent/Latch.h"

namespace graphscan {
namespace concurrent {

Latch::Latch(size_t counter) : counter_(counter) {}

bool Latch::down() {
  std::unique_lock<std::mutex> unique(lock_);
  if (counter_ == 0) {
    return false;
  }
  if (--counter_ == 0) {
    cond_.notify_all();
  }
  return true;
}

Status Latch::wait() {
  std::unique_lock<std::mutex> unique(lock_);
  cond_.wait(unique, [this]() { return counter_ == 0 || interrupted_; });
  if (counter_ != 0) {
    return Status::Interrupted("Interrupted while waiting for %zu tasks", counter_);
  }
  return Status::OK();
}

void Latch::interrupt() {
  std::unique_lock<std::mutex> unique(lock_);
  interrupted_ = true;
  cond_.notify_all();
}

bool Latch::isReady() {
  std::unique_lock<std::mutex> unique(lock_);
  return counter_ == 0;
}

}  // namespace concurrent
}  // namespace graphscan
