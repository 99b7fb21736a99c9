/* @file main.cpp
 * @brief zeddringd entry point: config, logging, signal mask, coordinator
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

// Linux headers
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

// Third-party headers
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Zeddring headers
#include "core/ConfigLoader.hpp"
#include "core/SystemCoordinator.hpp"

namespace {

  void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [--config <path>]\n"
              << "  JSON requests on stdin, JSON responses on stdout, logs on stderr.\n";
  }

} // namespace

int main(int argc, char** argv) {
  std::string configPath = "zeddring.json";
  for (int i = 1; i < argc; ++i) {
    if ((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) &&
        i + 1 < argc) {
      configPath = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage(argv[0]);
      return 0;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  // stdout carries the control channel
  spdlog::set_default_logger(spdlog::stderr_color_mt("zeddring"));

  zeddring::core::AppConfig config;
  try {
    config = zeddring::core::ConfigLoader(configPath).loadConfig();
  } catch (const std::exception& ex) {
    spdlog::critical("{}", ex.what());
    return 1;
  }

  const auto level = spdlog::level::from_str(config.logLevel);
  if (level == spdlog::level::off && config.logLevel != "off")
    spdlog::warn("unknown logLevel '{}', keeping info", config.logLevel);
  else
    spdlog::set_level(level);

  // block before any thread exists so only sigwait() sees them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  signal(SIGPIPE, SIG_IGN);

  try {
    zeddring::core::SystemCoordinator coordinator(config, STDIN_FILENO, STDOUT_FILENO);
    const int rc = coordinator.run();
    spdlog::shutdown();
    return rc;
  } catch (const std::exception& ex) {
    spdlog::critical("[main] {}", ex.what());
    spdlog::shutdown();
    return 1;
  }
}
