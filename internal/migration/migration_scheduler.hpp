#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace datarouter::migration {

/*
  Wake-up channel for executor workers.

  The task store is the queue; this only tells idle workers that new
  work may be claimable. A Notify() that arrives before a worker waits
  is not lost.
*/
class MigrationScheduler {
 public:
  void Notify();

  // Returns false once shut down; true on notify or timeout.
  bool WaitFor(std::chrono::milliseconds timeout);

  void Shutdown();

  // Re-arm after Shutdown() so workers can be started again.
  void Reset();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::uint64_t           pending_  = 0;
  bool                    shutdown_ = false;
};

} // namespace datarouter::migration
