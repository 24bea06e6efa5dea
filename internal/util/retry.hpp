#pragma once

#include <chrono>
#include <functional>
#include <thread>

#include "internal/util/time.hpp"

namespace rollout::util {

/*
  Bounded retry.

  A fixed number of attempts separated by a fixed backoff, cut short by
  a hard deadline. Never retries indefinitely.
*/
struct RetryPolicy {
  unsigned                  attempts = 3;
  std::chrono::milliseconds backoff{5000};
  std::chrono::milliseconds deadline{0};  // 0 = attempts * backoff only
};

// Sleep hook so tests do not wait in real time.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

inline void RealSleep(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

// Calls `attempt` until it returns true, the attempts run out or the
// deadline passes. Returns the number of attempts made when one
// succeeded, 0 otherwise. Exceptions from `attempt` propagate.
inline unsigned RetryUntil(const RetryPolicy& policy, const std::function<bool(unsigned)>& attempt, const SleepFn& sleep = RealSleep) {
  const auto start = Clock::now();

  for (unsigned n = 1; n <= policy.attempts; ++n) {
    if (attempt(n)) {
      return n;
    }
    if (n == policy.attempts) {
      break;
    }
    if (policy.deadline.count() > 0 && Clock::now() - start + policy.backoff >= policy.deadline) {
      break;
    }
    sleep(policy.backoff);
  }
  return 0;
}

} // namespace rollout::util
