#ifdef DOCTEST_CONFIG_DISABLE

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "argument_parser.h"
#include "demo_ui.h"
#include "options.h"
#include "version.h"

namespace {

std::filesystem::path get_executable_directory() {
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::filesystem::current_path();
  }
  return exe.parent_path();
}

std::filesystem::path get_default_config_path() {
  return get_executable_directory() / "pane-wm.toml";
}

} // namespace

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

using namespace panewm;

void apply_log_level(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

int main(int argc, char* argv[]) {
  // Flush spdlog on info-level messages to ensure immediate output
  spdlog::flush_on(spdlog::level::info);

  // Parse command-line arguments
  auto result = parse_args(argc, argv);
  if (!result.success) {
    spdlog::error("{}", result.error);
    return 1;
  }

  // Apply log level if specified
  if (result.args.options.log_level) {
    apply_log_level(*result.args.options.log_level);
  }

  // Determine config path to load
  std::filesystem::path config_path;
  bool config_explicitly_specified = false;

  if (result.args.options.config_path) {
    config_path = *result.args.options.config_path;
    config_explicitly_specified = true;
  } else {
    config_path = get_default_config_path();
  }

  // An explicit config must load; the default one is optional
  if (config_explicitly_specified) {
    auto loaded = read_options_toml(config_path);
    if (!loaded.success) {
      spdlog::error("Failed to load config: {}", loaded.error);
      return 1;
    }
    spdlog::info("Loaded config from: {}", config_path.string());
  }

  std::optional<std::filesystem::path> provider_path;
  if (config_explicitly_specified || std::filesystem::exists(config_path)) {
    provider_path = config_path;
  }

  Command command = result.args.command.value_or(Command{DemoCommand{}});

  int exit_code = 0;
  std::visit(overloaded{
                 [](const HelpCommand&) { print_usage(); },
                 [](const VersionCommand&) {
                   std::cout << "pane-wm v" << get_version_string() << std::endl;
                 },
                 [&](const DemoCommand&) {
                   spdlog::info("pane-wm v{}", get_version_string());
                   GlobalOptionsProvider options_provider(provider_path);
                   run_demo(options_provider);
                 },
                 [&](const InitConfigCommand& cmd) {
                   auto target_path = cmd.filepath ? std::filesystem::path(*cmd.filepath)
                                                   : get_default_config_path();
                   auto write_result =
                       write_options_toml(get_default_global_options(), target_path);
                   if (write_result.success) {
                     spdlog::info("Config written to: {}", target_path.string());
                   } else {
                     spdlog::error("Failed to write config: {}", write_result.error);
                     exit_code = 1;
                   }
                 },
             },
             command);
  return exit_code;
}

#endif
