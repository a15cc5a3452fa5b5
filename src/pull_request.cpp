#include "pull_request.hpp"
#include <exception>
#include <regex>

namespace prw {

std::string to_string(const PullRequestKey &key) {
  return key.owner + "/" + key.repo + "#" + std::to_string(key.number);
}

std::optional<PullRequestKey> parse_pr_url(const std::string &url) {
  static const std::regex pattern(
      R"(^\s*(?:https?://)?(?:www\.)?github\.com/([^/\s]+)/([^/\s]+)/pull/(\d+)(?:[/?#]\S*)?\s*$)",
      std::regex::ECMAScript | std::regex::icase);
  std::smatch match;
  if (!std::regex_match(url, match, pattern)) {
    return std::nullopt;
  }
  PullRequestKey key;
  key.owner = match[1].str();
  key.repo = match[2].str();
  try {
    key.number = std::stoi(match[3].str());
  } catch (const std::exception &) {
    return std::nullopt;
  }
  if (key.number <= 0) {
    return std::nullopt;
  }
  return key;
}

std::string format_pr_url(const PullRequestKey &key) {
  return "https://github.com/" + key.owner + "/" + key.repo + "/pull/" +
         std::to_string(key.number);
}

} // namespace prw
