#include "app.hpp"
#include "log.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    prw::ensure_default_logger();
    return prw::category_logger("main");
  }();
  return logger;
}

std::atomic<bool> g_stop{false};

extern "C" void handle_signal(int) { g_stop.store(true); }
} // namespace

/**
 * Program entry point orchestrating configuration loading and command
 * dispatch.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  prw::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  ret = app.execute(g_stop, std::cout);
  if (g_stop.load()) {
    main_log()->debug("Interrupted; exiting with code {}", ret);
  }
  spdlog::shutdown();
  return ret;
}
