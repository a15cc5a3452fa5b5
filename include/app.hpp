/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for prwatch.
 *
 * Declares the App class, which manages high-level application flow,
 * option loading, CLI parsing and subcommand dispatch.
 */

#ifndef PRWATCH_APP_HPP
#define PRWATCH_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "watcher.hpp"
#include <atomic>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

namespace prw {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse arguments, load the option file and initialize logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Execute the parsed subcommand.
   *
   * @param stop Cancellation flag for the `run` subcommand.
   * @param out Destination of user-facing output.
   * @return Process exit code.
   */
  int execute(const std::atomic<bool> &stop, std::ostream &out);

  /**
   * Retrieve the parsed command line options.
   *
   * @return Immutable reference to the populated CLI options structure.
   */
  const CliOptions &options() const { return options_; }

  /**
   * Retrieve the loaded configuration.
   *
   * @return Immutable reference to the resolved configuration values.
   */
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   *
   * @return `true` if the application should terminate, otherwise `false`.
   */
  bool should_exit() const { return should_exit_; }

  /// State document path resolved from CLI, option file and defaults.
  const std::string &state_path() const { return state_path_; }

  /// Replace the HTTP transport used for API and webhook requests.
  void set_http_client(HttpClientPtr http) { http_ = std::move(http); }

  /// How the last `run` subcommand ended; empty before one has finished.
  std::optional<RunOutcome> run_outcome() const { return run_outcome_; }

private:
  long timeout_ms() const;

  CliOptions options_;
  Config config_;
  std::string state_path_;
  HttpClientPtr http_;
  bool should_exit_{false};
  std::optional<RunOutcome> run_outcome_;
};

} // namespace prw

#endif // PRWATCH_APP_HPP
