#include "options.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <magic_enum/magic_enum.hpp>
#include <set>
#include <toml++/toml.hpp>

namespace panewm {

namespace {

toml::array color_to_array(const Color& c) {
  toml::array arr;
  arr.push_back(static_cast<int64_t>(c.r));
  arr.push_back(static_cast<int64_t>(c.g));
  arr.push_back(static_cast<int64_t>(c.b));
  arr.push_back(static_cast<int64_t>(c.a));
  return arr;
}

std::optional<Color> parse_color(const toml::array* arr) {
  if (!arr || arr->size() != 4) {
    return std::nullopt;
  }
  auto r = (*arr)[0].as_integer();
  auto g = (*arr)[1].as_integer();
  auto b = (*arr)[2].as_integer();
  auto a = (*arr)[3].as_integer();
  if (!r || !g || !b || !a) {
    return std::nullopt;
  }
  auto rv = r->get(), gv = g->get(), bv = b->get(), av = a->get();
  if (rv < 0 || rv > 255 || gv < 0 || gv > 255 || bv < 0 || bv > 255 || av < 0 || av > 255) {
    return std::nullopt;
  }
  return Color{static_cast<uint8_t>(rv), static_cast<uint8_t>(gv), static_cast<uint8_t>(bv),
               static_cast<uint8_t>(av)};
}

void read_color(const toml::table& render, const char* key, Color& target) {
  if (auto color = parse_color(render[key].as_array())) {
    target = *color;
  } else if (render[key]) {
    spdlog::error("Invalid {}: values must be 0-255. Using default.", key);
  }
}

toml::table pane_to_table(const PaneDefinition& def) {
  const auto& cfg = def.config;
  toml::table t;
  t.insert("id", def.id);
  t.insert("title", cfg.title);
  if (cfg.initial_rect.has_value()) {
    t.insert("x", cfg.initial_rect->x);
    t.insert("y", cfg.initial_rect->y);
    t.insert("width", cfg.initial_rect->width);
    t.insert("height", cfg.initial_rect->height);
  }
  t.insert("drag", cfg.capabilities.draggable);
  t.insert("resize", cfg.capabilities.resizable);
  t.insert("close", cfg.capabilities.closable);
  t.insert("min_max", cfg.capabilities.minimizable);
  t.insert("min_max_icons", cfg.triggers.min_max_icons);
  t.insert("min_double_click", cfg.triggers.minimize_on_double_click);
  t.insert("close_icon", cfg.triggers.close_icon);
  return t;
}

std::optional<PaneDefinition> parse_pane(const toml::table& t) {
  auto id = t["id"].value<std::string>();
  if (!id || id->empty()) {
    spdlog::error("Pane entry without an id skipped");
    return std::nullopt;
  }

  PaneDefinition def;
  def.id = *id;
  def.config.title = t["title"].value_or(*id);

  auto x = t["x"].value<double>();
  auto y = t["y"].value<double>();
  auto width = t["width"].value<double>();
  auto height = t["height"].value<double>();
  if (x || y || width || height) {
    def.config.initial_rect =
        geom::Rect{static_cast<float>(x.value_or(0.0)), static_cast<float>(y.value_or(0.0)),
                   static_cast<float>(width.value_or(0.0)),
                   static_cast<float>(height.value_or(0.0))};
    if (def.config.initial_rect->x < 0.0f || def.config.initial_rect->y < 0.0f) {
      spdlog::error("Pane '{}' has a negative position. Using (0, 0).", def.id);
      def.config.initial_rect->x = 0.0f;
      def.config.initial_rect->y = 0.0f;
    }
  }

  auto& caps = def.config.capabilities;
  caps.draggable = t["drag"].value_or(true);
  caps.resizable = t["resize"].value_or(true);
  caps.closable = t["close"].value_or(true);
  caps.minimizable = t["min_max"].value_or(true);

  auto& triggers = def.config.triggers;
  triggers.min_max_icons = t["min_max_icons"].value_or(true);
  triggers.minimize_on_double_click = t["min_double_click"].value_or(true);
  triggers.close_icon = t["close_icon"].value_or(true);

  return def;
}

} // anonymous namespace

std::vector<PaneDefinition> get_default_panes() {
  std::vector<PaneDefinition> panes;

  PaneDefinition notes;
  notes.id = "notes";
  notes.config.title = "Notes";
  notes.config.initial_rect = geom::Rect{40.0f, 40.0f, 320.0f, 220.0f};
  panes.push_back(notes);

  PaneDefinition inspector;
  inspector.id = "inspector";
  inspector.config.title = "Inspector";
  inspector.config.initial_rect = geom::Rect{420.0f, 80.0f, 280.0f, 340.0f};
  panes.push_back(inspector);

  PaneDefinition console;
  console.id = "console";
  console.config.title = "Console";
  console.config.initial_rect = geom::Rect{120.0f, 360.0f, 480.0f, 180.0f};
  panes.push_back(console);

  // Fixed-size pane: draggable, no resize handles
  PaneDefinition palette;
  palette.id = "palette";
  palette.config.title = "Palette";
  palette.config.capabilities.resizable = false;
  palette.config.initial_rect = geom::Rect{760.0f, 60.0f, 0.0f, 0.0f};
  panes.push_back(palette);

  // Pinned pane: cannot be dragged or closed
  PaneDefinition status;
  status.id = "status";
  status.config.title = "Status";
  status.config.capabilities.draggable = false;
  status.config.capabilities.closable = false;
  status.config.triggers.close_icon = false;
  status.config.initial_rect = geom::Rect{760.0f, 300.0f, 240.0f, 120.0f};
  panes.push_back(status);

  return panes;
}

GlobalOptions get_default_global_options() {
  GlobalOptions options;
  options.keyboardOptions.bindings = {
      {PaneAction::MinimizeFocused, "m"}, {PaneAction::ToggleMaximizeFocused, "f"},
      {PaneAction::CloseFocused, "w"},    {PaneAction::RestoreNewest, "r"},
      {PaneAction::ToggleDropdown, "d"},  {PaneAction::DebugPrint, "i"},
      {PaneAction::Validate, "c"},
  };
  options.panes = get_default_panes();
  return options;
}

WriteResult write_options_toml(const GlobalOptions& options,
                               const std::filesystem::path& filepath) {
  try {
    toml::table root;

    // Build minimize section
    toml::table minimize;
    minimize.insert("area_height", options.minimizeOptions.areaHeight);
    minimize.insert("item_width", options.minimizeOptions.itemMetrics.width);
    minimize.insert("item_margin_left", options.minimizeOptions.itemMetrics.margin_left);
    minimize.insert("item_margin_right", options.minimizeOptions.itemMetrics.margin_right);
    minimize.insert("resize_tolerance",
                    static_cast<int64_t>(options.minimizeOptions.resizeTolerance));
    root.insert("minimize", minimize);

    // Build render section
    toml::table render;
    render.insert("pane_color", color_to_array(options.renderOptions.paneColor));
    render.insert("header_color", color_to_array(options.renderOptions.headerColor));
    render.insert("front_border_color", color_to_array(options.renderOptions.frontBorderColor));
    render.insert("back_border_color", color_to_array(options.renderOptions.backBorderColor));
    render.insert("strip_color", color_to_array(options.renderOptions.stripColor));
    render.insert("header_height", options.renderOptions.headerHeight);
    root.insert("render", render);

    // Build demo section
    toml::table demo;
    demo.insert("width", options.demoOptions.width);
    demo.insert("height", options.demoOptions.height);
    demo.insert("double_click_ms", options.demoOptions.doubleClickMs);
    root.insert("demo", demo);

    // Build keyboard section
    toml::table keyboard;
    toml::array bindings;
    for (const auto& binding : options.keyboardOptions.bindings) {
      toml::table b;
      b.insert("action", std::string(magic_enum::enum_name(binding.action)));
      b.insert("key", binding.key);
      bindings.push_back(b);
    }
    keyboard.insert("bindings", bindings);
    root.insert("keyboard", keyboard);

    // Build panes array
    toml::array panes;
    for (const auto& def : options.panes) {
      panes.push_back(pane_to_table(def));
    }
    root.insert("panes", panes);

    std::ofstream file(filepath);
    if (!file) {
      return WriteResult{false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root;
    return WriteResult{true, ""};
  } catch (const std::exception& e) {
    return WriteResult{false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_options_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    GlobalOptions options = get_default_global_options();

    // Parse minimize section
    if (auto minimize = tbl["minimize"].as_table()) {
      auto& mo = options.minimizeOptions;
      if (auto v = (*minimize)["area_height"].value<double>()) {
        mo.areaHeight = static_cast<float>(*v);
      }
      if (auto v = (*minimize)["item_width"].value<double>()) {
        mo.itemMetrics.width = static_cast<float>(*v);
      }
      if (auto v = (*minimize)["item_margin_left"].value<double>()) {
        mo.itemMetrics.margin_left = static_cast<float>(*v);
      }
      if (auto v = (*minimize)["item_margin_right"].value<double>()) {
        mo.itemMetrics.margin_right = static_cast<float>(*v);
      }
      if (auto v = (*minimize)["resize_tolerance"].value<int64_t>()) {
        if (*v < 0) {
          spdlog::error("Invalid minimize.resize_tolerance value ({}): must be non-negative. "
                        "Using default.",
                        *v);
        } else {
          mo.resizeTolerance = static_cast<size_t>(*v);
        }
      }
    }

    // Validate minimize values - item must have a positive outer width
    if (overflow::outer_width(options.minimizeOptions.itemMetrics) <= 0.0f ||
        options.minimizeOptions.itemMetrics.width < 0.0f) {
      spdlog::error("Invalid minimize item size: outer width must be positive. Using default.");
      options.minimizeOptions.itemMetrics = MinimizeOptions{}.itemMetrics;
    }
    if (options.minimizeOptions.areaHeight <= 0.0f) {
      spdlog::error("Invalid minimize.area_height value ({}): must be positive. Using default.",
                    options.minimizeOptions.areaHeight);
      options.minimizeOptions.areaHeight = kDefaultMinimizeAreaHeight;
    }

    // Parse render section
    if (auto render = tbl["render"].as_table()) {
      read_color(*render, "pane_color", options.renderOptions.paneColor);
      read_color(*render, "header_color", options.renderOptions.headerColor);
      read_color(*render, "front_border_color", options.renderOptions.frontBorderColor);
      read_color(*render, "back_border_color", options.renderOptions.backBorderColor);
      read_color(*render, "strip_color", options.renderOptions.stripColor);
      if (auto v = (*render)["header_height"].value<double>()) {
        options.renderOptions.headerHeight = static_cast<float>(*v);
      }
    }

    if (options.renderOptions.headerHeight < 0.0f) {
      spdlog::error("Invalid render.header_height value ({}): must be non-negative. Using "
                    "default.",
                    options.renderOptions.headerHeight);
      options.renderOptions.headerHeight = kDefaultHeaderHeight;
    }

    // Parse demo section
    if (auto demo = tbl["demo"].as_table()) {
      if (auto v = (*demo)["width"].value<int64_t>()) {
        options.demoOptions.width = static_cast<int>(*v);
      }
      if (auto v = (*demo)["height"].value<int64_t>()) {
        options.demoOptions.height = static_cast<int>(*v);
      }
      if (auto v = (*demo)["double_click_ms"].value<int64_t>()) {
        options.demoOptions.doubleClickMs = static_cast<int>(*v);
      }
    }

    if (options.demoOptions.width <= 0 || options.demoOptions.height <= 0) {
      spdlog::error("Invalid demo size ({}x{}): must be positive. Using default.",
                    options.demoOptions.width, options.demoOptions.height);
      options.demoOptions.width = kDefaultDemoWidth;
      options.demoOptions.height = kDefaultDemoHeight;
    }
    if (options.demoOptions.doubleClickMs < 0) {
      spdlog::error("Invalid demo.double_click_ms value ({}): must be non-negative. Using "
                    "default.",
                    options.demoOptions.doubleClickMs);
      options.demoOptions.doubleClickMs = kDefaultDoubleClickMs;
    }

    // Parse keyboard section. Actions missing from the file keep their default key.
    if (auto keyboard = tbl["keyboard"].as_table()) {
      if (auto bindings = (*keyboard)["bindings"].as_array()) {
        for (const auto& b : *bindings) {
          auto binding_tbl = b.as_table();
          if (!binding_tbl) {
            continue;
          }
          auto action_str = (*binding_tbl)["action"].value<std::string>();
          auto key = (*binding_tbl)["key"].value<std::string>();
          if (!action_str || !key) {
            continue;
          }
          auto action = magic_enum::enum_cast<PaneAction>(*action_str);
          if (!action) {
            spdlog::error("Unknown keyboard action '{}' ignored", *action_str);
            continue;
          }
          auto& list = options.keyboardOptions.bindings;
          auto it = std::find_if(list.begin(), list.end(),
                                 [&](const KeyBinding& kb) { return kb.action == *action; });
          if (it != list.end()) {
            it->key = *key;
          } else {
            list.push_back({*action, *key});
          }
        }
      }
    }

    // Parse panes array. A present array replaces the default panes.
    if (auto panes = tbl["panes"].as_array()) {
      options.panes.clear();
      std::set<std::string> seen;
      for (const auto& node : *panes) {
        auto pane_tbl = node.as_table();
        if (!pane_tbl) {
          continue;
        }
        auto def = parse_pane(*pane_tbl);
        if (!def) {
          continue;
        }
        if (!seen.insert(def->id).second) {
          spdlog::error("Duplicate pane id '{}' skipped", def->id);
          continue;
        }
        options.panes.push_back(*def);
      }
    }

    return ReadResult{true, "", options};
  } catch (const toml::parse_error& e) {
    return ReadResult{false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return ReadResult{false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

GlobalOptionsProvider::GlobalOptionsProvider(std::optional<std::filesystem::path> path)
    : configPath(std::move(path)), options(get_default_global_options()), lastModified{} {
  if (configPath.has_value() && std::filesystem::exists(*configPath)) {
    auto result = read_options_toml(*configPath);
    if (result.success) {
      options = result.options;
      lastModified = std::filesystem::last_write_time(*configPath);
    } else {
      spdlog::error("Failed to load config: {}", result.error);
    }
  }
}

bool GlobalOptionsProvider::refresh() {
  if (!configPath.has_value()) {
    return false; // No file to monitor
  }
  if (!std::filesystem::exists(*configPath)) {
    return false; // File doesn't exist (yet)
  }

  auto currentModified = std::filesystem::last_write_time(*configPath);
  if (currentModified == lastModified) {
    return false; // No change
  }

  auto result = read_options_toml(*configPath);
  if (result.success) {
    options = result.options;
    lastModified = currentModified;
    spdlog::info("Config reloaded from: {}", configPath->string());
    return true;
  }
  spdlog::error("Failed to reload config: {}", result.error);
  return false;
}

} // namespace panewm
