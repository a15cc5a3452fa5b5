#include "ci_state.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace prw;

TEST_CASE("CiState parses known states case-insensitively") {
  CHECK(CiState::parse("pending").kind() == CiState::Kind::Pending);
  CHECK(CiState::parse("SUCCESS").kind() == CiState::Kind::Success);
  CHECK(CiState::parse("  Failure \n").kind() == CiState::Kind::Failure);
  CHECK(CiState::parse("error").kind() == CiState::Kind::Error);
  CHECK(CiState::parse("Success") == CiState::success());
}

TEST_CASE("CiState treats empty input as unknown") {
  CiState empty = CiState::parse("");
  CHECK(empty.empty());
  CHECK(empty.kind() == CiState::Kind::Unknown);
  CHECK(CiState::parse("   ").empty());
  CHECK(CiState() == empty);
  CHECK(display_string(empty) == "unknown");
  CHECK(empty.str().empty());
}

TEST_CASE("CiState keeps unrecognized text") {
  CiState odd = CiState::parse("Neutral");
  CHECK(odd.kind() == CiState::Kind::Unrecognized);
  CHECK(odd.str() == "neutral");
  CHECK_FALSE(odd.empty());
  CHECK(odd == CiState::parse("neutral"));
  CHECK(odd != CiState::parse("skipped"));

  CiState literal = CiState::parse("unknown");
  CHECK(literal.kind() == CiState::Kind::Unrecognized);
  CHECK_FALSE(literal.empty());
  CHECK(display_string(literal) == "unknown");
}

TEST_CASE("CiState failing classification") {
  CHECK(CiState::failure().is_failing());
  CHECK(CiState::error().is_failing());
  CHECK_FALSE(CiState::pending().is_failing());
  CHECK_FALSE(CiState::success().is_failing());
  CHECK_FALSE(CiState().is_failing());
  CHECK_FALSE(CiState::parse("cancelled").is_failing());
}
