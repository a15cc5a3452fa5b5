#include "version.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

TEST_CASE("version string includes a short commit") {
  CHECK(prw::version_string("1.2.3", "0123456789abcdef") == "1.2.3 (0123456)");
  CHECK(prw::version_string("1.2.3", "abc") == "1.2.3 (abc)");
}

TEST_CASE("version string without a commit") {
  CHECK(prw::version_string("1.2.3", "") == "1.2.3");
  CHECK(prw::version_string("1.2.3", "unknown") == "1.2.3");
  CHECK(prw::version_string().rfind(prw::kVersion, 0) == 0);
}
