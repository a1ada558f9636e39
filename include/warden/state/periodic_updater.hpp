#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace warden::state {

/// Runs `refresh` every `interval` on a dedicated thread. A slow refresh
/// pushes the next tick back; missed ticks are not replayed.
class periodic_updater final {
 public:
  using refresh_t = std::function<bool()>;

  periodic_updater(std::string name, std::chrono::milliseconds interval,
                   refresh_t refresh);
  ~periodic_updater();

  periodic_updater(const periodic_updater&) = delete;
  periodic_updater& operator=(const periodic_updater&) = delete;

  /// Runs the first refresh on the calling thread and only starts the
  /// background loop if it succeeded.
  bool start();

  void stop();

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  refresh_t refresh_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace warden::state
