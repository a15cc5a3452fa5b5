#include "ci_state.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace prw {

namespace {

std::string trim_lower(std::string_view raw) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!raw.empty() && is_space(static_cast<unsigned char>(raw.front()))) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && is_space(static_cast<unsigned char>(raw.back()))) {
    raw.remove_suffix(1);
  }
  std::string out(raw);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

} // namespace

CiState::CiState(Kind kind, std::string text)
    : kind_(kind), text_(std::move(text)) {}

CiState CiState::parse(std::string_view raw) {
  std::string normalized = trim_lower(raw);
  if (normalized.empty()) {
    return CiState();
  }
  if (normalized == "pending") {
    return pending();
  }
  if (normalized == "success") {
    return success();
  }
  if (normalized == "failure") {
    return failure();
  }
  if (normalized == "error") {
    return error();
  }
  return CiState(Kind::Unrecognized, std::move(normalized));
}

std::string display_string(const CiState &state) {
  return state.empty() ? std::string("unknown") : state.str();
}

} // namespace prw
