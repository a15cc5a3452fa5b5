/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for prwatch.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef PRWATCH_CLI_HPP
#define PRWATCH_CLI_HPP

#include <exception>
#include <string>
#include <vector>

namespace prw {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /**
   * Retrieve the exit code that triggered the exception.
   *
   * @return Numeric process exit code.
   */
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/** Subcommand selected on the command line. */
enum class Command {
  None,        ///< No subcommand parsed
  Watch,       ///< Start watching a pull request
  Unwatch,     ///< Stop watching a pull request
  List,        ///< Show the watch list
  Run,         ///< Run the watcher loop
  Broadcast,   ///< One-shot broadcast
  ConfigShow,  ///< Print settings
  ConfigSet,   ///< Change a setting
  ConfigUnset, ///< Reset a setting
  Version,     ///< Print version information
  Completion   ///< Print a shell completion script
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Global options left empty (or zero) defer to the option file and then to
 * built-in defaults.
 */
struct CliOptions {
  bool verbose = false;         ///< Enables debug logging
  std::string config_file;      ///< Optional path to an option file
  std::string log_level;        ///< Logging verbosity level override
  std::string log_file;         ///< Optional path to a log file
  std::string state_file;       ///< State document path override
  std::string api_base;         ///< GitHub API base URL override
  int http_timeout{0};          ///< HTTP timeout override in seconds
  Command command{Command::None}; ///< Selected subcommand
  std::string pr_url;           ///< Pull request URL for watch/unwatch
  bool list_json{false};        ///< Emit JSON from `list`
  std::string notify_on;        ///< `run --on` filter, empty for default
  std::string broadcast_filter{"all"}; ///< `broadcast --filter`
  std::string webhook_override; ///< `broadcast --webhook`
  bool dry_run{false};          ///< `broadcast --dry-run`
  std::string config_key;       ///< Key for `config set/unset`
  std::string config_value;     ///< Value for `config set`
  std::string completion_shell; ///< bash, zsh, fish or powershell
  std::string completion_script; ///< Script generated for `completion`
};

/**
 * Parse command line arguments.
 *
 * @param argc Number of arguments.
 * @param argv Argument vector.
 * @return Parsed options.
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid; the exit code mirrors CLI11's.
 */
CliOptions parse_cli(int argc, char **argv);

/// Shells accepted by the `completion` subcommand.
const std::vector<std::string> &completion_shells();

} // namespace prw

#endif // PRWATCH_CLI_HPP
