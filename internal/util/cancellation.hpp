#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace danmaku::util {

/*
  Shared, idempotent stop signal.

  Any number of threads may poll or wait on it; Cancel() wakes all waiters
  and the signal stays set. Nothing consumes it.
*/
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();

  bool IsCancelled() const;

  // Blocks up to `timeout`. Returns true if the token was (or became) cancelled.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
};

} // namespace danmaku::util
