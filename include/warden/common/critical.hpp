#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace warden::common {

/// Boot-time fatal path: log, flush the async logger, and bring the process
/// down. Never used on the request path.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace warden::common
