#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <utility>
#include <vector>

namespace {
prw::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "prwatch");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return prw::parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const prw::CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("test cli", "[cli]") {
  prw::CliOptions watch =
      parse({"watch", "https://github.com/o/r/pull/1"});
  CHECK(watch.command == prw::Command::Watch);
  CHECK(watch.pr_url == "https://github.com/o/r/pull/1");
  CHECK_FALSE(watch.verbose);

  prw::CliOptions unwatch =
      parse({"-v", "unwatch", "https://github.com/o/r/pull/1"});
  CHECK(unwatch.command == prw::Command::Unwatch);
  CHECK(unwatch.verbose);

  prw::CliOptions list = parse({"list", "--json"});
  CHECK(list.command == prw::Command::List);
  CHECK(list.list_json);
  CHECK_FALSE(parse({"list"}).list_json);

  prw::CliOptions run = parse({"run", "--on", "fail"});
  CHECK(run.command == prw::Command::Run);
  CHECK(run.notify_on == "fail");
  CHECK(parse({"run"}).notify_on.empty());

  prw::CliOptions version = parse({"version"});
  CHECK(version.command == prw::Command::Version);
}

TEST_CASE("broadcast options", "[cli]") {
  prw::CliOptions defaults = parse({"broadcast"});
  CHECK(defaults.command == prw::Command::Broadcast);
  CHECK(defaults.broadcast_filter == "all");
  CHECK_FALSE(defaults.dry_run);
  CHECK(defaults.webhook_override.empty());

  prw::CliOptions opts = parse({"broadcast", "--filter", "FAILING",
                                "--webhook", "https://hooks.example/x",
                                "--dry-run"});
  CHECK(opts.broadcast_filter == "failing");
  CHECK(opts.webhook_override == "https://hooks.example/x");
  CHECK(opts.dry_run);

  CHECK(exit_code_of({"broadcast", "--filter", "sometimes"}) != 0);
}

TEST_CASE("config subcommands", "[cli]") {
  prw::CliOptions show = parse({"config", "show"});
  CHECK(show.command == prw::Command::ConfigShow);

  prw::CliOptions set =
      parse({"config", "set", "poll_interval_seconds", "30"});
  CHECK(set.command == prw::Command::ConfigSet);
  CHECK(set.config_key == "poll_interval_seconds");
  CHECK(set.config_value == "30");

  prw::CliOptions unset = parse({"config", "unset", "webhook_url"});
  CHECK(unset.command == prw::Command::ConfigUnset);
  CHECK(unset.config_key == "webhook_url");

  CHECK(exit_code_of({"config"}) != 0);
  CHECK(exit_code_of({"config", "set", "webhook_url"}) != 0);
}

TEST_CASE("global options", "[cli]") {
  prw::CliOptions opts =
      parse({"--config", "cfg.yaml", "--log-level", "debug", "--log-file",
             "prw.log", "--state-file", "state.json", "--api-base",
             "http://localhost", "--http-timeout", "5", "list"});
  CHECK(opts.config_file == "cfg.yaml");
  CHECK(opts.log_level == "debug");
  CHECK(opts.log_file == "prw.log");
  CHECK(opts.state_file == "state.json");
  CHECK(opts.api_base == "http://localhost");
  CHECK(opts.http_timeout == 5);
  CHECK(opts.command == prw::Command::List);

  CHECK(exit_code_of({"--http-timeout", "0", "list"}) != 0);
}

TEST_CASE("parse errors and help exit through CliParseExit", "[cli]") {
  CHECK(exit_code_of({}) != 0);
  CHECK(exit_code_of({"watch"}) != 0);
  CHECK(exit_code_of({"frobnicate"}) != 0);
  CHECK(exit_code_of({"--help"}) == 0);
  CHECK(exit_code_of({"--version"}) == 0);
}

TEST_CASE("completion scripts cover the command tree", "[cli]") {
  prw::CliOptions bash = parse({"completion", "bash"});
  CHECK(bash.command == prw::Command::Completion);
  CHECK(bash.completion_shell == "bash");
  const std::string &script = bash.completion_script;
  CHECK(script.find("complete -F _prwatch prwatch") != std::string::npos);
  CHECK(script.find("\"prwatch config set\") path=") != std::string::npos);
  CHECK(script.find("\"prwatch broadcast --filter\")") != std::string::npos);
  CHECK(script.find("compgen -W \"all changed failing\"") !=
        std::string::npos);
  CHECK(script.find("compgen -W \"change fail success\"") !=
        std::string::npos);
  CHECK(script.find("--dry-run") != std::string::npos);
  CHECK(script.find("--state-file") != std::string::npos);

  prw::CliOptions zsh = parse({"completion", "ZSH"});
  CHECK(zsh.completion_shell == "zsh");
  CHECK(zsh.completion_script.rfind("#compdef prwatch\n", 0) == 0);

  std::string fish = parse({"completion", "fish"}).completion_script;
  CHECK(fish.find("complete -c prwatch -n '__fish_use_subcommand' -a watch") !=
        std::string::npos);
  CHECK(fish.find("-l on -xa 'change fail success'") != std::string::npos);
  CHECK(fish.find("-a 'bash zsh fish powershell'") != std::string::npos);

  std::string ps = parse({"completion", "powershell"}).completion_script;
  CHECK(ps.find("Register-ArgumentCompleter -Native -CommandName prwatch") !=
        std::string::npos);
  CHECK(ps.find("'prwatch broadcast --filter' { @('all', 'changed', "
                "'failing') }") != std::string::npos);

  CHECK(prw::completion_shells().size() == 4);
  CHECK(exit_code_of({"completion", "tcsh"}) != 0);
  CHECK(exit_code_of({"completion"}) != 0);
}
