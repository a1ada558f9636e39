#include <warden/state/periodic_updater.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace warden::state {

namespace {

bool guarded(const std::string& name,
             const periodic_updater::refresh_t& refresh) {
  try {
    return refresh();
  } catch (const std::exception& e) {
    spdlog::warn("refresh of {} threw: {}", name, e.what());
    return false;
  }
}

}  // namespace

periodic_updater::periodic_updater(std::string name,
                                   const std::chrono::milliseconds interval,
                                   refresh_t refresh)
    : name_{std::move(name)}, interval_{interval}, refresh_{std::move(refresh)} {}

periodic_updater::~periodic_updater() { stop(); }

bool periodic_updater::start() {
  if (!guarded(name_, refresh_)) {
    spdlog::error("initial fetch of {} failed", name_);
    return false;
  }
  spdlog::info("{} updater started, interval {} ms", name_, interval_.count());
  thread_ = std::thread{[this]() { run(); }};
  return true;
}

void periodic_updater::stop() {
  {
    auto lock = std::lock_guard{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void periodic_updater::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    if (wake_.wait_for(lock, interval_, [this]() { return stopping_; })) {
      break;
    }
    lock.unlock();
    if (!guarded(name_, refresh_)) {
      spdlog::warn("failed to refresh {}, retrying in {} ms", name_,
                   interval_.count());
    }
    lock.lock();
  }
}

}  // namespace warden::state
