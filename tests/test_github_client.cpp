#include "github_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace prw;

namespace {

class MockHttpClient : public HttpClient {
public:
  std::map<std::string, HttpResponse> responses;
  std::vector<std::string> urls;
  std::vector<std::string> last_headers;
  bool fail_transport = false;

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    urls.push_back(url);
    last_headers = headers;
    if (fail_transport) {
      throw TransportError("connection refused");
    }
    auto it = responses.find(url);
    if (it == responses.end()) {
      HttpResponse res;
      res.status_code = 404;
      return res;
    }
    return it->second;
  }

  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override {
    (void)url;
    (void)data;
    (void)headers;
    return {};
  }
};

HttpResponse reply(long status, std::string body) {
  HttpResponse res;
  res.status_code = status;
  res.body = std::move(body);
  return res;
}

bool has_header(const std::vector<std::string> &headers,
                const std::string &value) {
  for (const auto &h : headers) {
    if (h == value) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("GitHubClient reads the head and title of a pull request") {
  auto http = std::make_shared<MockHttpClient>();
  http->responses["https://api.github.com/repos/o/r/pulls/5"] =
      reply(200, R"({"title":"Fix bug","head":{"sha":"abc123"}})");
  GitHubClient client("tok", http);
  PullRequestHead head = client.fetch_head("o", "r", 5);
  CHECK(head.sha == "abc123");
  CHECK(head.title == "Fix bug");
  CHECK(has_header(http->last_headers, "Authorization: Bearer tok"));
  CHECK(has_header(http->last_headers, "Accept: application/vnd.github+json"));
}

TEST_CASE("GitHubClient reads the aggregate commit status") {
  auto http = std::make_shared<MockHttpClient>();
  http->responses["https://api.github.com/repos/o/r/commits/abc/status"] =
      reply(200, R"({"state":"failure","statuses":[]})");
  http->responses["https://api.github.com/repos/o/r/commits/def/status"] =
      reply(200, R"({"statuses":[]})");
  GitHubClient client("tok", http);
  CHECK(client.fetch_aggregate_status("o", "r", "abc") == "failure");
  CHECK(client.fetch_aggregate_status("o", "r", "def").empty());
}

TEST_CASE("GitHubClient honours a custom API base") {
  auto http = std::make_shared<MockHttpClient>();
  http->responses["http://localhost:8080/api/repos/o/r/pulls/1"] =
      reply(200, R"({"head":{"sha":"s"}})");
  GitHubClient client("", http, "http://localhost:8080/api/");
  CHECK(client.api_base() == "http://localhost:8080/api");
  CHECK(client.fetch_head("o", "r", 1).title.empty());
  CHECK_FALSE(has_header(http->last_headers, "Authorization: Bearer "));
}

TEST_CASE("GitHubClient classifies failures") {
  auto http = std::make_shared<MockHttpClient>();
  GitHubClient client("tok", http);

  CHECK_THROWS_AS(client.fetch_head("o", "r", 9), NotFoundError);

  http->responses["https://api.github.com/repos/o/r/pulls/1"] =
      reply(500, "oops");
  try {
    client.fetch_head("o", "r", 1);
    FAIL("expected HttpStatusError");
  } catch (const HttpStatusError &e) {
    CHECK(e.status_code() == 500);
  }

  http->responses["https://api.github.com/repos/o/r/pulls/2"] =
      reply(200, "not json");
  CHECK_THROWS_AS(client.fetch_head("o", "r", 2), GitHubError);

  http->responses["https://api.github.com/repos/o/r/pulls/3"] =
      reply(200, R"({"title":"no head"})");
  CHECK_THROWS_AS(client.fetch_head("o", "r", 3), GitHubError);

  http->fail_transport = true;
  CHECK_THROWS_AS(client.fetch_head("o", "r", 1), GitHubTransportError);
}
