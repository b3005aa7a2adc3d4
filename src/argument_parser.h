#pragma once

#include <optional>
#include <string>
#include <variant>

namespace panewm {

// ===== Command Structs =====
struct HelpCommand {}; // --help or -h

struct DemoCommand {};

struct VersionCommand {};

struct InitConfigCommand {
  std::optional<std::string> filepath; // Empty = use default (pane-wm.toml next to exe)
};

// Variant holding all possible commands
using Command = std::variant<HelpCommand, DemoCommand, VersionCommand, InitConfigCommand>;

// ===== CLI Options =====
enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

struct CliOptions {
  std::optional<LogLevel> log_level;      // --logmode <level>
  std::optional<std::string> config_path; // --config <filepath>
};

// ===== Parsed Arguments =====
struct ParsedArgs {
  CliOptions options;
  std::optional<Command> command; // nullopt if no command specified
};

// ===== Parser Result =====
struct ParseResult {
  bool success;
  std::string error; // Set if success == false
  ParsedArgs args;
};

// Parse command-line arguments
ParseResult parse_args(int argc, char* argv[]);

// Print usage information to stdout
void print_usage();

} // namespace panewm
