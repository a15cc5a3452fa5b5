#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

namespace {
std::string read_all(const std::string &path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}
} // namespace

TEST_CASE("test log") {
  std::string path =
      (std::filesystem::temp_directory_path() / "prw_test.log").string();
  std::remove(path.c_str());

  // Category loggers created before initialization follow the file sink.
  auto early = prw::category_logger("watcher");
  prw::init_logger(spdlog::level::info, "", path);
  spdlog::debug("root debug line");
  spdlog::info("info message");
  early->info("category message");
  prw::configure_log_categories({{"watcher", spdlog::level::debug}});
  early->debug("category debug message");
  prw::category_logger("store")->debug("hidden store message");
  spdlog::shutdown();

  std::string content = read_all(path);
  REQUIRE(!content.empty());
  CHECK(content.find("info message") != std::string::npos);
  CHECK(content.find("root debug line") == std::string::npos);
  CHECK(content.find("category message") != std::string::npos);
  CHECK(content.find("category debug message") != std::string::npos);
  CHECK(content.find("hidden store message") == std::string::npos);
  CHECK(content.find("[prw.watcher]") != std::string::npos);
  std::remove(path.c_str());
}
