/* Copyright (c) 2018 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#ifndef COMMON_CONCURRENT_LATCH_H_
#define COMMON_CONCURRENT_LATCH_H_

#include "common/base/Base.h"
#include "common/base/Status.h"

/**
 * Latch is an one-shot synchronization object.
 * It provides an synchronization point for multiple threads.
 *
 * Unlike a plain count down latch, a waiter could be woken up early by
 * interrupt(), in which case wait() reports Status::Interrupted.
 */

namespace graphscan {
namespace concurrent {

class Latch final {
 public:
  /**
   * @counter:  initial counter,
   *            typically number of participating tasks.
   * A zero counter makes the latch ready at once.
   */
  explicit Latch(size_t counter);
  ~Latch() = default;

  Latch(const Latch&) = delete;
  Latch& operator=(const Latch&) = delete;

  /**
   * Decrements the internal counter by one.
   * If the counter reaches 0, all blocking(in `wait')
   * threads will be given the green light.
   * Returns false if counter already zeroed.
   */
  bool down();

  /**
   * Blocks until the counter reaches 0 or the latch is interrupted.
   * Fails with Status::Interrupted if the latch is interrupted first.
   * The interruption is sticky, later waits return at once.
   */
  Status wait();

  // Wake up all waiters, the counter is left untouched
  void interrupt();

  // Returns true if internal counter already zeroed.
  bool isReady();

 private:
  size_t counter_{0};
  bool interrupted_{false};
  std::mutex lock_;
  std::condition_variable cond_;
};

}  // namespace concurrent
}  // namespace graphscan

#endif  // COMMON_CONCURRENT_LATCH_H_
