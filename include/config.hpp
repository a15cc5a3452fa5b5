#ifndef PRWATCH_CONFIG_HPP
#define PRWATCH_CONFIG_HPP

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace prw {

/**
 * Runtime options loaded from a YAML, TOML, or JSON file.
 *
 * These options tune the process (logging, networking, sinks). The watch
 * list and its settings live in the state document managed by WatchStore.
 */
class Config {
public:
  /// Logging level name.
  const std::string &log_level() const { return log_level_; }

  /// Set logging level name.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// spdlog pattern; empty keeps the default.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set log pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Optional log file path.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated logs.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Category -> level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout; non-positive values are rejected.
  void set_http_timeout(int t);

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// State document path; empty selects the default location.
  const std::string &state_file() const { return state_file_; }

  /// Set state document path.
  void set_state_file(const std::string &path) { state_file_ = path; }

  /// Whether `run` adds the desktop notification sink.
  bool desktop_notifications() const { return desktop_notifications_; }

  /// Enable or disable the desktop notification sink.
  void set_desktop_notifications(bool enable) {
    desktop_notifications_ = enable;
  }

  /**
   * Load configuration from a file on disk.
   *
   * @param path Path to a `.yaml`, `.yml`, `.json`, `.toml` or `.tml` file.
   * @return Populated configuration.
   * @throws std::runtime_error When the file cannot be opened or parsed, or
   *         when the extension is unsupported.
   */
  static Config from_file(const std::string &path);

  /// Construct configuration from JSON.
  static Config from_json(const nlohmann::json &j);

  /**
   * Apply values from a JSON document.
   *
   * Grouping sections (`logging`, `network`, `notifications`, `state`) are
   * flattened first so grouped and flat documents are equivalent.
   */
  void load_json(const nlohmann::json &j);

private:
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  int http_timeout_ = 15;
  std::string api_base_ = "https://api.github.com";
  std::string state_file_;
  bool desktop_notifications_ = true;
};

} // namespace prw

#endif // PRWATCH_CONFIG_HPP
