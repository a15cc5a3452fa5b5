/**
 * @file github_client.cpp
 * @brief GitHub REST client reading pull request heads and commit statuses.
 */

#include "github_client.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace prw {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::string trim_trailing_slashes(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

std::string repo_path(const std::string &owner, const std::string &repo) {
  return "/repos/" + escape_path_segment(owner) + "/" +
         escape_path_segment(repo);
}

/// Parse a response body, mapping syntax errors to GitHubError.
nlohmann::json parse_body(const std::string &url, const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    github_client_log()->debug("Malformed JSON from {}: {}", url, e.what());
    throw GitHubError("malformed response from " + url);
  }
}

} // namespace

GitHubClient::GitHubClient(std::string token, HttpClientPtr http,
                           std::string api_base, long timeout_ms)
    : token_(std::move(token)), http_(std::move(http)),
      api_base_(trim_trailing_slashes(std::move(api_base))) {
  if (!http_) {
    http_ = std::make_shared<CurlHttpClient>(timeout_ms);
  }
  if (api_base_.empty()) {
    api_base_ = "https://api.github.com";
  }
}

/**
 * Issue an authenticated GET and classify the response.
 *
 * @param url Absolute request URL.
 * @return Response body of a 2xx reply.
 * @throws GitHubTransportError, NotFoundError or HttpStatusError.
 */
std::string GitHubClient::get_json(const std::string &url) {
  std::vector<std::string> headers{"Accept: application/vnd.github+json",
                                   "X-GitHub-Api-Version: 2022-11-28"};
  if (!token_.empty()) {
    headers.push_back("Authorization: Bearer " + token_);
  }
  HttpResponse res;
  try {
    res = http_->get(url, headers);
  } catch (const TransportError &e) {
    throw GitHubTransportError(e.what());
  }
  if (res.status_code == 404) {
    throw NotFoundError("not found: " + url);
  }
  if (!res.ok()) {
    throw HttpStatusError(res.status_code,
                          "GitHub API returned status " +
                              std::to_string(res.status_code) + " for " + url);
  }
  return res.body;
}

PullRequestHead GitHubClient::fetch_head(const std::string &owner,
                                         const std::string &repo,
                                         int number) {
  const std::string url = api_base_ + repo_path(owner, repo) + "/pulls/" +
                          std::to_string(number);
  nlohmann::json j = parse_body(url, get_json(url));
  PullRequestHead head;
  if (j.contains("head") && j["head"].is_object()) {
    head.sha = j["head"].value("sha", std::string{});
  }
  if (j.contains("title") && j["title"].is_string()) {
    head.title = j["title"].get<std::string>();
  }
  if (head.sha.empty()) {
    throw GitHubError("response for " + url + " has no head sha");
  }
  github_client_log()->debug("{}/{}#{} head {}", owner, repo, number,
                             head.sha);
  return head;
}

std::string GitHubClient::fetch_aggregate_status(const std::string &owner,
                                                 const std::string &repo,
                                                 const std::string &sha) {
  const std::string url = api_base_ + repo_path(owner, repo) + "/commits/" +
                          escape_path_segment(sha) + "/status";
  nlohmann::json j = parse_body(url, get_json(url));
  std::string state;
  if (j.contains("state") && j["state"].is_string()) {
    state = j["state"].get<std::string>();
  }
  github_client_log()->debug("{}/{}@{} status '{}'", owner, repo, sha, state);
  return state;
}

} // namespace prw
