#include "notification_filter.hpp"

namespace prw {

bool should_notify(const CiState &previous, const CiState &current,
                   NotificationFilter filter) {
  if (previous.empty() || previous == current) {
    return false;
  }
  switch (filter) {
  case NotificationFilter::Fail:
    return current.is_failing();
  case NotificationFilter::Success:
    return current.kind() == CiState::Kind::Success;
  case NotificationFilter::Change:
    return true;
  }
  return true;
}

} // namespace prw
