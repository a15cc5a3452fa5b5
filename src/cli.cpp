#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace prw {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

constexpr const char *kFooter =
    "Logging categories: app, broadcast, cli, config, github.client, http, "
    "logging, main, notify, store, watcher.\n"
    "Option files accept 'log_categories' as a NAME: LEVEL mapping.";

const std::vector<std::string> kBroadcastFilters = {"all", "changed",
                                                    "failing"};
const std::vector<std::string> kNotifyModes = {"change", "fail", "success"};
const std::vector<std::string> kShells = {"bash", "zsh", "fish",
                                          "powershell"};

/** One command level of the CLI tree as seen by shell completion. */
struct CompletionNode {
  std::vector<std::string> path; ///< Subcommand names below the root
  std::vector<std::pair<std::string, std::string>> subcommands;
  std::vector<std::pair<std::string, std::string>> flags;
  std::map<std::string, std::vector<std::string>> flag_values;
  std::vector<std::string> positional_values;
};

/**
 * Value sets offered for options, keyed by long name or positional name.
 * Free-form values (URLs, paths) have no entry.
 */
const std::vector<std::string> *values_for(const std::string &name) {
  static const std::map<std::string, const std::vector<std::string> *> sets =
      {{"filter", &kBroadcastFilters},
       {"on", &kNotifyModes},
       {"shell", &kShells}};
  auto it = sets.find(name);
  return it == sets.end() ? nullptr : it->second;
}

void collect_nodes(const CLI::App &app, std::vector<std::string> path,
                   std::vector<CompletionNode> &nodes) {
  CompletionNode node;
  node.path = path;
  for (const CLI::Option *opt :
       app.get_options([](const CLI::Option *) { return true; })) {
    if (opt->get_group().empty()) {
      continue;
    }
    if (!opt->nonpositional()) {
      if (const auto *values = values_for(opt->get_name())) {
        node.positional_values = *values;
      }
      continue;
    }
    for (const auto &lname : opt->get_lnames()) {
      node.flags.emplace_back("--" + lname, opt->get_description());
      if (const auto *values = values_for(lname)) {
        node.flag_values["--" + lname] = *values;
      }
    }
    for (const auto &sname : opt->get_snames()) {
      node.flags.emplace_back("-" + sname, opt->get_description());
    }
  }
  std::vector<const CLI::App *> subs =
      app.get_subcommands([](const CLI::App *) { return true; });
  for (const CLI::App *sub : subs) {
    node.subcommands.emplace_back(sub->get_name(), sub->get_description());
  }
  nodes.push_back(std::move(node));
  for (const CLI::App *sub : subs) {
    std::vector<std::string> child = path;
    child.push_back(sub->get_name());
    collect_nodes(*sub, std::move(child), nodes);
  }
}

std::string path_key(const std::vector<std::string> &path) {
  std::string key = "prwatch";
  for (const auto &name : path) {
    key += " " + name;
  }
  return key;
}

std::string join(const std::vector<std::string> &words) {
  std::string out;
  for (const auto &word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}

/// Every word offered at a node: subcommands, flags, positional values.
std::vector<std::string> node_words(const CompletionNode &node) {
  std::vector<std::string> words;
  for (const auto &sub : node.subcommands) {
    words.push_back(sub.first);
  }
  for (const auto &flag : node.flags) {
    words.push_back(flag.first);
  }
  words.insert(words.end(), node.positional_values.begin(),
               node.positional_values.end());
  return words;
}

std::string bash_script(const std::vector<CompletionNode> &nodes) {
  std::ostringstream os;
  os << "# bash completion for prwatch\n"
     << "_prwatch() {\n"
     << "  local cur prev path word i\n"
     << "  COMPREPLY=()\n"
     << "  cur=\"${COMP_WORDS[COMP_CWORD]}\"\n"
     << "  prev=\"${COMP_WORDS[COMP_CWORD-1]}\"\n"
     << "  path=\"prwatch\"\n"
     << "  for ((i = 1; i < COMP_CWORD; i++)); do\n"
     << "    word=\"${COMP_WORDS[i]}\"\n"
     << "    case \"$path $word\" in\n";
  for (const auto &node : nodes) {
    if (!node.path.empty()) {
      os << "      \"" << path_key(node.path)
         << "\") path=\"$path $word\" ;;\n";
    }
  }
  os << "    esac\n"
     << "  done\n"
     << "  case \"$path $prev\" in\n";
  for (const auto &node : nodes) {
    for (const auto &entry : node.flag_values) {
      os << "    \"" << path_key(node.path) << " " << entry.first
         << "\")\n      COMPREPLY=($(compgen -W \"" << join(entry.second)
         << "\" -- \"$cur\"))\n      return 0 ;;\n";
    }
  }
  os << "  esac\n"
     << "  case \"$path\" in\n";
  for (const auto &node : nodes) {
    os << "    \"" << path_key(node.path)
       << "\")\n      COMPREPLY=($(compgen -W \"" << join(node_words(node))
       << "\" -- \"$cur\")) ;;\n";
  }
  os << "  esac\n"
     << "  return 0\n"
     << "}\n"
     << "complete -F _prwatch prwatch\n";
  return os.str();
}

std::string fish_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string fish_script(const std::vector<CompletionNode> &nodes) {
  std::ostringstream os;
  os << "# fish completion for prwatch\n"
     << "complete -c prwatch -f\n";
  for (const auto &node : nodes) {
    std::string seen;
    if (!node.path.empty()) {
      seen = "__fish_seen_subcommand_from " + node.path.back();
    }
    if (!node.subcommands.empty()) {
      std::string cond;
      if (node.path.empty()) {
        cond = "__fish_use_subcommand";
      } else {
        std::vector<std::string> names;
        for (const auto &sub : node.subcommands) {
          names.push_back(sub.first);
        }
        cond = seen + "; and not __fish_seen_subcommand_from " + join(names);
      }
      for (const auto &sub : node.subcommands) {
        os << "complete -c prwatch -n " << fish_quote(cond) << " -a "
           << sub.first << " -d " << fish_quote(sub.second) << '\n';
      }
    }
    std::string prefix = "complete -c prwatch";
    if (!seen.empty()) {
      prefix += " -n " + fish_quote(seen);
    }
    for (const auto &flag : node.flags) {
      const std::string &name = flag.first;
      os << prefix;
      if (name.rfind("--", 0) == 0) {
        os << " -l " << name.substr(2);
      } else {
        os << " -s " << name.substr(1);
      }
      auto values = node.flag_values.find(name);
      if (values != node.flag_values.end()) {
        os << " -xa " << fish_quote(join(values->second));
      }
      if (!flag.second.empty()) {
        os << " -d " << fish_quote(flag.second);
      }
      os << '\n';
    }
    if (!node.positional_values.empty()) {
      os << prefix << " -a " << fish_quote(join(node.positional_values))
         << '\n';
    }
  }
  return os.str();
}

std::string powershell_list(const std::vector<std::string> &words) {
  std::string out = "@(";
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "'";
    for (char c : words[i]) {
      if (c == '\'') {
        out += "''";
      } else {
        out.push_back(c);
      }
    }
    out += "'";
  }
  out += ")";
  return out;
}

std::string powershell_script(const std::vector<CompletionNode> &nodes) {
  std::ostringstream os;
  os << "# powershell completion for prwatch\n"
     << "Register-ArgumentCompleter -Native -CommandName prwatch "
        "-ScriptBlock {\n"
     << "    param($wordToComplete, $commandAst, $cursorPosition)\n"
     << "    $words = @($commandAst.CommandElements | "
        "ForEach-Object { $_.ToString() })\n"
     << "    $path = 'prwatch'\n"
     << "    $prev = ''\n"
     << "    for ($i = 1; $i -lt $words.Count; $i++) {\n"
     << "        $word = $words[$i]\n"
     << "        if ($i -eq $words.Count - 1 -and $word -eq $wordToComplete) "
        "{ break }\n"
     << "        $prev = $word\n"
     << "        switch (\"$path $word\") {\n";
  for (const auto &node : nodes) {
    if (!node.path.empty()) {
      os << "            '" << path_key(node.path)
         << "' { $path = \"$path $word\" }\n";
    }
  }
  os << "        }\n"
     << "    }\n"
     << "    $candidates = switch (\"$path $prev\") {\n";
  for (const auto &node : nodes) {
    for (const auto &entry : node.flag_values) {
      os << "        '" << path_key(node.path) << " " << entry.first << "' { "
         << powershell_list(entry.second) << " }\n";
    }
  }
  os << "        default {\n"
     << "            switch ($path) {\n";
  for (const auto &node : nodes) {
    os << "                '" << path_key(node.path) << "' { "
       << powershell_list(node_words(node)) << " }\n";
  }
  os << "                default { @() }\n"
     << "            }\n"
     << "        }\n"
     << "    }\n"
     << "    $candidates | Where-Object { $_ -like \"$wordToComplete*\" } | "
        "ForEach-Object {\n"
     << "        [System.Management.Automation.CompletionResult]::new("
        "$_, $_, 'ParameterValue', $_)\n"
     << "    }\n"
     << "}\n";
  return os.str();
}

/**
 * Render a completion script for @p shell from the parsed CLI11 tree.
 *
 * zsh reuses the bash script through `bashcompinit`.
 */
std::string completion_script(const CLI::App &app, const std::string &shell) {
  std::vector<CompletionNode> nodes;
  collect_nodes(app, {}, nodes);
  if (shell == "fish") {
    return fish_script(nodes);
  }
  if (shell == "powershell") {
    return powershell_script(nodes);
  }
  if (shell == "zsh") {
    return "#compdef prwatch\n"
           "autoload -U +X bashcompinit && bashcompinit\n" +
           bash_script(nodes);
  }
  return bash_script(nodes);
}
} // namespace

const std::vector<std::string> &completion_shells() { return kShells; }

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"prwatch: watch GitHub pull request CI status and notify on "
               "changes"};
  app.footer(kFooter);
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to option file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "prwatch " << version_string() << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option("--state-file", options.state_file,
                 "Path to the watch state document (default "
                 "~/.prw/config.json)")
      ->type_name("FILE")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("--log-file", options.log_file, "Write logs to FILE")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option("--api-base", options.api_base, "GitHub API base URL")
      ->type_name("URL")
      ->group("Network");
  app.add_option("--http-timeout", options.http_timeout,
                 "HTTP request timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::PositiveNumber)
      ->group("Network");

  auto *watch = app.add_subcommand("watch", "Start watching a pull request");
  watch->add_option("url", options.pr_url,
                    "Pull request URL, e.g. "
                    "https://github.com/owner/repo/pull/123")
      ->required();
  watch->callback([&options] { options.command = Command::Watch; });

  auto *unwatch =
      app.add_subcommand("unwatch", "Stop watching a pull request");
  unwatch->add_option("url", options.pr_url, "Pull request URL")->required();
  unwatch->callback([&options] { options.command = Command::Unwatch; });

  auto *list = app.add_subcommand("list", "List watched pull requests");
  list->add_flag("--json", options.list_json, "Output as JSON");
  list->callback([&options] { options.command = Command::List; });

  auto *run = app.add_subcommand(
      "run", "Poll watched pull requests and notify on status changes");
  run->add_option("--on", options.notify_on,
                  "Notify on: " + join(kNotifyModes) + " (default change)")
      ->type_name("MODE");
  run->callback([&options] { options.command = Command::Run; });

  auto *broadcast = app.add_subcommand(
      "broadcast", "Send the current status of watched pull requests once");
  broadcast
      ->add_option("--filter", options.broadcast_filter,
                   "Which pull requests to include: all, changed, failing")
      ->type_name("FILTER")
      ->transform(CLI::IsMember(kBroadcastFilters, CLI::ignore_case));
  broadcast->add_option("--webhook", options.webhook_override,
                        "Override the configured webhook URL")
      ->type_name("URL");
  broadcast->add_flag("--dry-run", options.dry_run,
                      "Preview without sending notifications");
  broadcast->callback([&options] { options.command = Command::Broadcast; });

  auto *config = app.add_subcommand("config", "Manage settings");
  config->require_subcommand(1);
  auto *show = config->add_subcommand("show", "Show current settings");
  show->callback([&options] { options.command = Command::ConfigShow; });
  auto *set = config->add_subcommand("set", "Set a setting");
  set->add_option("key", options.config_key,
                  "poll_interval_seconds, webhook_url, github_token or "
                  "notification_filter")
      ->required();
  set->add_option("value", options.config_value, "New value")->required();
  set->callback([&options] { options.command = Command::ConfigSet; });
  auto *unset = config->add_subcommand("unset", "Reset a setting to default");
  unset->add_option("key", options.config_key, "Setting to reset")
      ->required();
  unset->callback([&options] { options.command = Command::ConfigUnset; });

  auto *version = app.add_subcommand("version", "Print version information");
  version->callback([&options] { options.command = Command::Version; });

  auto *completion = app.add_subcommand(
      "completion", "Generate a shell completion script");
  completion->add_option("shell", options.completion_shell,
                         "bash, zsh, fish or powershell")
      ->required()
      ->transform(CLI::IsMember(kShells, CLI::ignore_case));
  completion->footer("Load with:\n"
                     "  bash:       source <(prwatch completion bash)\n"
                     "  zsh:        prwatch completion zsh > "
                     "\"${fpath[1]}/_prwatch\"\n"
                     "  fish:       prwatch completion fish | source\n"
                     "  powershell: prwatch completion powershell | "
                     "Out-String | Invoke-Expression");
  completion->callback([&options] { options.command = Command::Completion; });

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (options.command == Command::Completion) {
    options.completion_script =
        completion_script(app, options.completion_shell);
  }
  cli_log()->debug("Parsed command line ({} argument(s))", argc);
  return options;
}

} // namespace prw
