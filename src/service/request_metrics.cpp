#include <warden/service/request_metrics.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <string>

namespace warden::service {

void request_metrics::observe_request(const endpoint value) {
  requests_[static_cast<std::size_t>(value)].fetch_add(
      1, std::memory_order_relaxed);
}

void request_metrics::observe_error(const warden::schema::error_code code) {
  errors_[static_cast<std::size_t>(code)].fetch_add(1,
                                                    std::memory_order_relaxed);
}

uint64_t request_metrics::requests(const endpoint value) const {
  return requests_[static_cast<std::size_t>(value)].load(
      std::memory_order_relaxed);
}

uint64_t request_metrics::errors(const warden::schema::error_code code) const {
  return errors_[static_cast<std::size_t>(code)].load(
      std::memory_order_relaxed);
}

uint64_t request_metrics::total_errors() const {
  auto total = uint64_t{0};
  for (const auto& counter : errors_) {
    total += counter.load(std::memory_order_relaxed);
  }
  return total;
}

void request_metrics::log_summary() const {
  auto line = std::string{};
  for (const auto& [name, value] : kEndpointMappings) {
    if (auto count = requests(value); count > 0) {
      line += fmt::format(" {}={}", name, count);
    }
  }
  for (const auto& [name, code] : warden::schema::kErrorCodeMappings) {
    if (auto count = errors(code); count > 0) {
      line += fmt::format(" {}={}", name, count);
    }
  }
  spdlog::info("requests:{}", line.empty() ? " none" : line);
}

}  // namespace warden::service
