/**
 * @file notification_filter.hpp
 * @brief Policy deciding which status transitions are worth a notification.
 */
#ifndef PRWATCH_NOTIFICATION_FILTER_HPP
#define PRWATCH_NOTIFICATION_FILTER_HPP

#include "ci_state.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace prw {

/** \brief Transition filter applied by the watcher loop. */
enum class NotificationFilter {
  Change,  ///< Notify on any transition.
  Fail,    ///< Notify only when landing on failure or error.
  Success  ///< Notify only when landing on success.
};

/**
 * @brief Converts a NotificationFilter to its configuration spelling.
 * @param filter Filter mode.
 * @return "change", "fail" or "success".
 */
inline std::string to_string(NotificationFilter filter) {
  switch (filter) {
  case NotificationFilter::Change:
    return "change";
  case NotificationFilter::Fail:
    return "fail";
  case NotificationFilter::Success:
    return "success";
  }
  return "change";
}

/**
 * @brief Parses a filter mode.
 * @param value String to parse (case-insensitive, surrounding spaces ignored).
 * @return Parsed filter, or std::nullopt when the value is not recognized.
 */
inline std::optional<NotificationFilter>
notification_filter_from_string(std::string value) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(),
              value.end());
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "change") {
    return NotificationFilter::Change;
  }
  if (value == "fail") {
    return NotificationFilter::Fail;
  }
  if (value == "success") {
    return NotificationFilter::Success;
  }
  return std::nullopt;
}

/**
 * @brief Parses a filter mode, falling back to `Change` for invalid input.
 */
inline NotificationFilter
normalize_notification_filter(const std::string &value) {
  return notification_filter_from_string(value).value_or(
      NotificationFilter::Change);
}

/**
 * Decide whether a transition between two observed states should notify.
 *
 * A first observation (empty @p previous) only records the baseline and an
 * unchanged state never notifies.
 *
 * @param previous Last stored state.
 * @param current Freshly fetched state.
 * @param filter Configured filter mode.
 * @return True when a StatusChangeEvent should be delivered.
 */
bool should_notify(const CiState &previous, const CiState &current,
                   NotificationFilter filter);

} // namespace prw

#endif // PRWATCH_NOTIFICATION_FILTER_HPP
