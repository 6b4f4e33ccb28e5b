#include "utils/Shutdown.hpp"

#include <atomic>
#include <csignal>

namespace mp::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};

extern "C" void handle_termination_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_signal_handlers() {
  std::signal(SIGINT, handle_termination_signal);
  std::signal(SIGTERM, handle_termination_signal);
}

} // namespace mp::runtime
