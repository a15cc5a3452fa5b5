/**
 * @file ci_state.hpp
 * @brief Normalized aggregate CI status of a pull request head commit.
 */

#ifndef PRWATCH_CI_STATE_HPP
#define PRWATCH_CI_STATE_HPP

#include <string>
#include <string_view>

namespace prw {

/**
 * Aggregate commit status as reported by the GitHub combined status API.
 *
 * Values are normalized on ingestion (trimmed and lowercased). Strings that
 * are not one of the known states are kept verbatim in the `Unrecognized`
 * arm so that a transition between two unknown server values is still
 * observable.
 */
class CiState {
public:
  enum class Kind {
    Unknown,     ///< Never checked or the server reported no state
    Pending,     ///< Checks are still running
    Success,     ///< All checks passed
    Failure,     ///< At least one check failed
    Error,       ///< A check errored
    Unrecognized ///< Any other non-empty state string
  };

  /// Construct the unknown state.
  CiState() = default;

  /**
   * Parse a raw status string.
   *
   * @param raw Status text from the API or the state file.
   * @return Normalized state; whitespace-only input yields `Unknown`.
   */
  static CiState parse(std::string_view raw);

  /// Convenience constructors for the known states.
  static CiState pending() { return CiState(Kind::Pending, "pending"); }
  static CiState success() { return CiState(Kind::Success, "success"); }
  static CiState failure() { return CiState(Kind::Failure, "failure"); }
  static CiState error() { return CiState(Kind::Error, "error"); }

  Kind kind() const { return kind_; }

  /// Normalized text; empty for `Unknown`.
  const std::string &str() const { return text_; }

  /// True when no state has been observed.
  bool empty() const { return kind_ == Kind::Unknown; }

  /// True for `failure` and `error`.
  bool is_failing() const {
    return kind_ == Kind::Failure || kind_ == Kind::Error;
  }

  bool operator==(const CiState &other) const {
    if (kind_ != other.kind_) {
      return false;
    }
    return kind_ != Kind::Unrecognized || text_ == other.text_;
  }

  bool operator!=(const CiState &other) const { return !(*this == other); }

private:
  CiState(Kind kind, std::string text);

  Kind kind_{Kind::Unknown};
  std::string text_;
};

/**
 * Text used when presenting a state to a user.
 *
 * @return `unknown` for the empty state, the normalized text otherwise.
 */
std::string display_string(const CiState &state);

} // namespace prw

#endif // PRWATCH_CI_STATE_HPP
