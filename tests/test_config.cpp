#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {
std::string write_temp(const std::string &name, const std::string &text) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path.string());
  f << text;
  return path.string();
}
} // namespace

TEST_CASE("config defaults") {
  prw::Config cfg;
  CHECK(cfg.log_level() == "info");
  CHECK(cfg.log_rotate() == 3);
  CHECK_FALSE(cfg.log_compress());
  CHECK(cfg.http_timeout() == 15);
  CHECK(cfg.api_base() == "https://api.github.com");
  CHECK(cfg.state_file().empty());
  CHECK(cfg.desktop_notifications());
  CHECK_THROWS_AS(cfg.set_http_timeout(0), std::invalid_argument);
}

TEST_CASE("test config loading") {
  std::string ypath = write_temp("prw_cfg.yaml", "logging:\n"
                                                 "  log_level: debug\n"
                                                 "  log_file: prw.log\n"
                                                 "  log_rotate: 0\n"
                                                 "  log_categories:\n"
                                                 "    watcher: trace\n"
                                                 "network:\n"
                                                 "  http_timeout: 60\n"
                                                 "  api_base: http://ghe/api\n"
                                                 "notifications:\n"
                                                 "  desktop_notifications: "
                                                 "false\n"
                                                 "state:\n"
                                                 "  state_file: /tmp/s.json\n");
  prw::Config ycfg = prw::Config::from_file(ypath);
  CHECK(ycfg.log_level() == "debug");
  CHECK(ycfg.log_file() == "prw.log");
  CHECK(ycfg.log_rotate() == 0);
  CHECK(ycfg.log_categories().at("watcher") == "trace");
  CHECK(ycfg.http_timeout() == 60);
  CHECK(ycfg.api_base() == "http://ghe/api");
  CHECK_FALSE(ycfg.desktop_notifications());
  CHECK(ycfg.state_file() == "/tmp/s.json");

  nlohmann::json doc;
  doc["log_level"] = "warn";
  doc["log_compress"] = true;
  doc["log_categories"] = nlohmann::json::array({"http=debug", "store"});
  doc["network"] = {{"http_timeout", 5}};
  std::string jpath = write_temp("prw_cfg.json", doc.dump());
  prw::Config jcfg = prw::Config::from_file(jpath);
  CHECK(jcfg.log_level() == "warn");
  CHECK(jcfg.log_compress());
  CHECK(jcfg.log_categories().at("http") == "debug");
  CHECK(jcfg.log_categories().at("store") == "debug");
  CHECK(jcfg.http_timeout() == 5);

  std::string tpath = write_temp("prw_cfg.toml", "[logging]\n"
                                                 "log_level = \"error\"\n"
                                                 "log_pattern = \"%v\"\n"
                                                 "[network]\n"
                                                 "http_timeout = 30\n");
  prw::Config tcfg = prw::Config::from_file(tpath);
  CHECK(tcfg.log_level() == "error");
  CHECK(tcfg.log_pattern() == "%v");
  CHECK(tcfg.http_timeout() == 30);
}

TEST_CASE("config loading failures") {
  CHECK_THROWS(prw::Config::from_file("no_extension"));
  CHECK_THROWS(prw::Config::from_file(write_temp("prw_cfg.ini", "x=1")));
  CHECK_THROWS(prw::Config::from_file(write_temp("prw_bad.json", "{oops")));
  CHECK_THROWS(prw::Config::from_file(
      write_temp("prw_bad_timeout.json", R"({"http_timeout": -1})")));
  CHECK_THROWS(prw::Config::from_file(
      (std::filesystem::temp_directory_path() / "prw_missing.json")
          .string()));
}

TEST_CASE("empty yaml document yields defaults") {
  prw::Config cfg = prw::Config::from_file(write_temp("prw_empty.yaml", ""));
  CHECK(cfg.log_level() == "info");
  CHECK(cfg.http_timeout() == 15);
}

TEST_CASE("config from json") {
  nlohmann::json j = {{"state", {{"state_file", "state.json"}}},
                      {"desktop_notifications", false}};
  prw::Config cfg = prw::Config::from_json(j);
  CHECK(cfg.state_file() == "state.json");
  CHECK_FALSE(cfg.desktop_notifications());
}
