#include "pull_request.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace prw;

TEST_CASE("parse_pr_url extracts owner repo and number") {
  auto key = parse_pr_url("https://github.com/octo/widgets/pull/42");
  REQUIRE(key);
  CHECK(key->owner == "octo");
  CHECK(key->repo == "widgets");
  CHECK(key->number == 42);
  CHECK(to_string(*key) == "octo/widgets#42");
  CHECK(format_pr_url(*key) == "https://github.com/octo/widgets/pull/42");
}

TEST_CASE("parse_pr_url tolerates common URL variants") {
  auto files = parse_pr_url("https://github.com/octo/widgets/pull/7/files");
  REQUIRE(files);
  CHECK(files->number == 7);
  CHECK(parse_pr_url("http://www.github.com/a/b/pull/1"));
  CHECK(parse_pr_url("github.com/a/b/pull/1"));
  CHECK(parse_pr_url("https://github.com/a/b/pull/3#issuecomment-1"));
  CHECK(parse_pr_url("https://github.com/a/b.js/pull/3")->repo == "b.js");
}

TEST_CASE("parse_pr_url rejects non pull request URLs") {
  CHECK_FALSE(parse_pr_url(""));
  CHECK_FALSE(parse_pr_url("https://github.com/a/b"));
  CHECK_FALSE(parse_pr_url("https://github.com/a/b/issues/4"));
  CHECK_FALSE(parse_pr_url("https://gitlab.com/a/b/pull/4"));
  CHECK_FALSE(parse_pr_url("https://github.com/a/b/pull/abc"));
  CHECK_FALSE(parse_pr_url("https://github.com/a/b/pull/0"));
}

TEST_CASE("pull request keys compare all fields") {
  PullRequestKey a{"o", "r", 1};
  PullRequestKey b{"o", "r", 1};
  PullRequestKey c{"o", "r", 2};
  PullRequestKey d{"o", "x", 1};
  CHECK(a == b);
  CHECK(a != c);
  CHECK(a != d);
}
