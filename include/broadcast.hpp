/**
 * @file broadcast.hpp
 * @brief One-shot notification of the current status of watched pull
 *        requests.
 */

#ifndef PRWATCH_BROADCAST_HPP
#define PRWATCH_BROADCAST_HPP

#include "github_client.hpp"
#include "notification.hpp"
#include "watch_store.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

namespace prw {

/** \brief Inclusion filter for a broadcast. */
enum class BroadcastFilter {
  All,     ///< Every successfully fetched pull request.
  Changed, ///< State differs from a non-empty stored state.
  Failing  ///< Fetched state is failure or error.
};

/**
 * @brief Converts a BroadcastFilter to its command-line spelling.
 */
inline std::string to_string(BroadcastFilter filter) {
  switch (filter) {
  case BroadcastFilter::All:
    return "all";
  case BroadcastFilter::Changed:
    return "changed";
  case BroadcastFilter::Failing:
    return "failing";
  }
  return "all";
}

/**
 * @brief Parses a broadcast filter.
 * @param value String to parse (case-insensitive).
 * @return Parsed filter, or std::nullopt when not recognized.
 */
inline std::optional<BroadcastFilter>
broadcast_filter_from_string(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "all") {
    return BroadcastFilter::All;
  }
  if (value == "changed") {
    return BroadcastFilter::Changed;
  }
  if (value == "failing") {
    return BroadcastFilter::Failing;
  }
  return std::nullopt;
}

/**
 * Decide whether a pull request is part of a broadcast.
 *
 * @param filter Inclusion filter.
 * @param previous Stored state before the fetch.
 * @param current Freshly fetched state.
 */
bool broadcast_includes(BroadcastFilter filter, const CiState &previous,
                        const CiState &current);

/** Broadcast parameters. */
struct BroadcastOptions {
  BroadcastFilter filter{BroadcastFilter::All}; ///< Inclusion filter
  bool dry_run{false}; ///< Print a preview instead of notifying
};

/** Tally of a broadcast. */
struct BroadcastReport {
  std::size_t checked{0};           ///< Pull requests fetched successfully
  std::size_t failed{0};            ///< Pull requests whose fetch failed
  std::size_t included{0};          ///< Pull requests passing the filter
  std::size_t sent{0};              ///< Events delivered successfully
  std::size_t delivery_failures{0}; ///< Events with a failed sink
};

/**
 * Notify about every watched pull request matching a filter.
 *
 * Observed state is committed for every fetched pull request whether or not
 * it was included, and the store is persisted once at the end.
 *
 * @param client Status source.
 * @param store Watch list.
 * @param notifier Event sink; not used in dry-run mode.
 * @param options Filter and dry-run flag.
 * @param out Destination of dry-run preview lines.
 * @return Tally of the run.
 * @throws PersistenceError When saving the store fails.
 */
BroadcastReport run_broadcast(StatusClient &client, WatchStore &store,
                              Notifier &notifier,
                              const BroadcastOptions &options,
                              std::ostream &out);

} // namespace prw

#endif // PRWATCH_BROADCAST_HPP
