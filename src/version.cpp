#include "version.hpp"

namespace prw {

std::string version_string(std::string_view version, std::string_view commit) {
  std::string out(version);
  if (commit.empty() || commit == "unknown") {
    return out;
  }
  out += " (";
  out += commit.substr(0, 7);
  out += ')';
  return out;
}

} // namespace prw
