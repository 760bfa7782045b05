#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace ridedispatch::core {
class DispatchEngine;
}

namespace ridedispatch::maintenance {

struct SweepReport {
  size_t expanded_broadcasts = 0;
  size_t lifted_suspensions  = 0;
};

/*
  Periodic housekeeping:
    widen broadcasts that outlived their matching timeout,
    lift expired suspensions,
    purge expired rows.
*/
class DispatchSweeper {
 public:
  DispatchSweeper(std::shared_ptr<core::DispatchEngine> engine, std::chrono::milliseconds interval);
  ~DispatchSweeper();

  void Start();
  void Stop();

  // One pass on the calling thread.
  SweepReport RunOnce();

 private:
  void Loop();

  std::shared_ptr<core::DispatchEngine> engine_;
  std::chrono::milliseconds             interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace ridedispatch::maintenance
