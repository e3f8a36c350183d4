#include "migration_scheduler.hpp"

namespace datarouter::migration {

void MigrationScheduler::Notify() {
  {
    std::lock_guard lock(mutex_);
    ++pending_;
  }
  cv_.notify_all();
}

bool MigrationScheduler::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || pending_ > 0; });

  if (shutdown_) return false;
  pending_ = 0;
  return true;
}

void MigrationScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void MigrationScheduler::Reset() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
  pending_  = 0;
}

} // namespace datarouter::migration
