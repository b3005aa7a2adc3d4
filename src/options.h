#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "overflow.h"
#include "pane.h"

namespace panewm {

// RGBA color (0-255 per channel)
struct Color {
  uint8_t r, g, b, a;
};

// Keyboard actions on the focused pane
enum class PaneAction {
  MinimizeFocused,
  ToggleMaximizeFocused,
  CloseFocused,
  RestoreNewest,
  ToggleDropdown,
  DebugPrint,
  Validate,
};

// Maps an action to a key name, e.g. "m", "f2", "escape"
struct KeyBinding {
  PaneAction action;
  std::string key;
};

struct KeyboardOptions {
  std::vector<KeyBinding> bindings;
};

// Default minimize area values
constexpr float kDefaultMinimizeAreaHeight = 32.0f;
constexpr float kDefaultMinimizedItemWidth = 120.0f;
constexpr float kDefaultMinimizedItemMargin = 4.0f;

// Default demo window
constexpr int kDefaultDemoWidth = 1280;
constexpr int kDefaultDemoHeight = 800;
constexpr int kDefaultDoubleClickMs = 400;

constexpr float kDefaultHeaderHeight = 20.0f;

// Minimize area (strip/dropdown) configuration
struct MinimizeOptions {
  float areaHeight = kDefaultMinimizeAreaHeight;
  overflow::ItemMetrics itemMetrics{kDefaultMinimizedItemWidth, kDefaultMinimizedItemMargin,
                                    kDefaultMinimizedItemMargin};
  size_t resizeTolerance = overflow::kDefaultResizeTolerance;
};

// Colors and chrome sizes used by the demo renderer
struct RenderOptions {
  Color paneColor{236, 239, 244, 255};
  Color headerColor{48, 55, 97, 255}; // Header and resize handles
  Color frontBorderColor{0, 120, 255, 255};
  Color backBorderColor{120, 120, 120, 255};
  Color stripColor{210, 214, 222, 255};
  float headerHeight = kDefaultHeaderHeight;
};

// Demo window configuration
struct DemoOptions {
  int width = kDefaultDemoWidth;
  int height = kDefaultDemoHeight;
  int doubleClickMs = kDefaultDoubleClickMs;
};

// A pane the demo registers at startup
struct PaneDefinition {
  std::string id;
  PaneConfig config;
};

// Global options container
struct GlobalOptions {
  MinimizeOptions minimizeOptions;
  RenderOptions renderOptions;
  DemoOptions demoOptions;
  KeyboardOptions keyboardOptions;
  std::vector<PaneDefinition> panes;
};

// Get default global options
GlobalOptions get_default_global_options();

// Get the panes registered by default (convenience function)
std::vector<PaneDefinition> get_default_panes();

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;     // Set if success == false
  GlobalOptions options; // Valid if success == true
};

// Write GlobalOptions to a TOML file
WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath);

// Read GlobalOptions from a TOML file
ReadResult read_options_toml(const std::filesystem::path& filepath);

// Provides GlobalOptions, optionally monitoring a config file for changes
class GlobalOptionsProvider {
public:
  std::optional<std::filesystem::path> configPath;
  GlobalOptions options;
  std::filesystem::file_time_type lastModified;

  explicit GlobalOptionsProvider(std::optional<std::filesystem::path> configPath = std::nullopt);

  // Check for file changes and reload if necessary. Returns true if options changed.
  bool refresh();
};

} // namespace panewm
