#ifdef DOCTEST_CONFIG_DISABLE

#include "demo_ui.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include "manager.h"
#include "raylib.h"
#include "spdlog/spdlog.h"

namespace panewm {

namespace {

constexpr int kTitleFontSize = 14;
constexpr float kTitlePadding = 6.0f;
constexpr float kDropdownToggleWidth = 96.0f;
constexpr float kDropdownListWidth = 180.0f;

// Convert panewm::Color to Raylib Color
::Color to_raylib_color(const Color& c) {
  return ::Color{c.r, c.g, c.b, c.a};
}

Rectangle to_rectangle(const geom::Rect& r) {
  return Rectangle{r.x, r.y, r.width, r.height};
}

struct DemoState {
  WindowManager manager;
  // Affordances the manager attached, per pane
  std::map<std::string, std::vector<AffordanceRole>> affordances;
  std::optional<std::string> last_header_click_pane;
  double last_header_click_time = 0.0;
};

bool has_affordance(const DemoState& state, const std::string& pane_id, AffordanceRole role) {
  auto it = state.affordances.find(pane_id);
  if (it == state.affordances.end()) {
    return false;
  }
  return std::find(it->second.begin(), it->second.end(), role) != it->second.end();
}

// ============================================================================
// Pane chrome layout
// ============================================================================

// Pane body inside its resize container (handles on every side)
geom::Rect body_rect(const Pane& pane) {
  float inset = frame_margin(pane) / 2.0f;
  return {pane.rect.x + inset, pane.rect.y + inset, pane.rect.width, pane.rect.height};
}

geom::Rect header_rect(const Pane& pane, float header_height) {
  auto body = body_rect(pane);
  return {body.x, body.y, body.width, std::min(header_height, body.height)};
}

// Header buttons present on the pane, right to left
std::vector<AffordanceRole> header_buttons(const DemoState& state, const Pane& pane) {
  std::vector<AffordanceRole> buttons;
  for (auto role :
       {AffordanceRole::CloseButton, AffordanceRole::MaximizeButton, AffordanceRole::MinimizeButton}) {
    if (has_affordance(state, pane.id, role)) {
      buttons.push_back(role);
    }
  }
  return buttons;
}

geom::Rect header_button_rect(const Pane& pane, float header_height, size_t slot) {
  auto header = header_rect(pane, header_height);
  float size = header.height;
  return {header.x + header.width - size * static_cast<float>(slot + 1), header.y, size, size};
}

std::optional<AffordanceRole> button_at(const DemoState& state, const Pane& pane,
                                        float header_height, geom::Point p) {
  auto buttons = header_buttons(state, pane);
  for (size_t slot = 0; slot < buttons.size(); ++slot) {
    if (geom::contains_point(header_button_rect(pane, header_height, slot), p)) {
      return buttons[slot];
    }
  }
  return std::nullopt;
}

std::optional<geom::ResizeZone> zone_at(const Pane& pane, geom::Point p) {
  if (!pane.capabilities.resizable) {
    return std::nullopt;
  }
  auto body = body_rect(pane);
  bool left = p.x < body.x;
  bool right = p.x >= body.x + body.width;
  bool top = p.y < body.y;
  bool bottom = p.y >= body.y + body.height;

  if (top && left) return geom::ResizeZone::UpperLeft;
  if (top && right) return geom::ResizeZone::UpperRight;
  if (bottom && left) return geom::ResizeZone::LowerLeft;
  if (bottom && right) return geom::ResizeZone::LowerRight;
  if (left) return geom::ResizeZone::Left;
  if (right) return geom::ResizeZone::Right;
  if (top) return geom::ResizeZone::Top;
  if (bottom) return geom::ResizeZone::Bottom;
  return std::nullopt;
}

// ============================================================================
// Minimize area layout
// ============================================================================

float item_outer_width(const WindowManager& manager, const MinimizeOptions& options) {
  return manager.minimized.item_outer_width.value_or(overflow::outer_width(options.itemMetrics));
}

geom::Rect strip_item_rect(const WindowManager& manager, const MinimizeOptions& options,
                           size_t position) {
  float outer = item_outer_width(manager, options);
  float inner = outer - options.itemMetrics.margin_left - options.itemMetrics.margin_right;
  return {outer * static_cast<float>(position) + options.itemMetrics.margin_left,
          manager.viewport.height + 2.0f, std::max(inner, 1.0f), options.areaHeight - 4.0f};
}

geom::Rect dropdown_toggle_rect(const WindowManager& manager, const MinimizeOptions& options) {
  return {0.0f, manager.viewport.height, kDropdownToggleWidth, options.areaHeight};
}

// Dropdown list items open upwards from the minimize area
geom::Rect dropdown_item_rect(const WindowManager& manager, const MinimizeOptions& options,
                              size_t position) {
  return {0.0f, manager.viewport.height - options.areaHeight * static_cast<float>(position + 1),
          kDropdownListWidth, options.areaHeight};
}

// ============================================================================
// Input
// ============================================================================

std::optional<int> key_from_name(const std::string& name) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower.size() == 1 && lower[0] >= 'a' && lower[0] <= 'z') {
    return KEY_A + (lower[0] - 'a');
  }
  if (lower.size() == 1 && lower[0] >= '0' && lower[0] <= '9') {
    return KEY_ZERO + (lower[0] - '0');
  }
  if (lower.size() >= 2 && lower[0] == 'f') {
    try {
      int n = std::stoi(lower.substr(1));
      if (n >= 1 && n <= 12) {
        return KEY_F1 + (n - 1);
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  if (lower == "escape") return KEY_ESCAPE;
  if (lower == "space") return KEY_SPACE;
  if (lower == "tab") return KEY_TAB;
  if (lower == "enter") return KEY_ENTER;
  if (lower == "backspace") return KEY_BACKSPACE;
  if (lower == "delete") return KEY_DELETE;
  return std::nullopt;
}

void log_unknown_keys(const KeyboardOptions& keyboard) {
  for (const auto& binding : keyboard.bindings) {
    if (!key_from_name(binding.key).has_value()) {
      spdlog::warn("Unknown key '{}' for action {}", binding.key,
                   magic_enum::enum_name(binding.action));
    }
  }
}

std::optional<session::PointerButton> pressed_button() {
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) return session::PointerButton::Primary;
  if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) return session::PointerButton::Secondary;
  if (IsMouseButtonPressed(MOUSE_BUTTON_MIDDLE)) return session::PointerButton::Middle;
  return std::nullopt;
}

// Returns true if the click landed on the minimize area or the open dropdown list
bool handle_minimize_area_click(DemoState& state, const MinimizeOptions& options, geom::Point p) {
  auto& manager = state.manager;
  const auto& layout = manager.minimized;

  if (layout.mode == overflow::OverflowMode::Dropdown) {
    if (layout.dropdown_open) {
      for (size_t k = 0; k < layout.dropdown_items.size(); ++k) {
        if (geom::contains_point(dropdown_item_rect(manager, options, k), p)) {
          size_t index = layout.dropdown_items[k].index;
          if (!manager.on_restore_requested(index)) {
            spdlog::warn("Restore from dropdown slot {} failed", index);
          }
          return true;
        }
      }
    }
    if (geom::contains_point(dropdown_toggle_rect(manager, options), p)) {
      manager.minimized.toggle_dropdown();
      return true;
    }
    return p.y >= manager.viewport.height;
  }

  if (p.y < manager.viewport.height) {
    return false;
  }
  for (size_t k = 0; k < layout.strip_items.size(); ++k) {
    if (geom::contains_point(strip_item_rect(manager, options, k), p)) {
      size_t index = layout.strip_items[k].index;
      if (!manager.on_restore_requested(index)) {
        spdlog::warn("Restore from strip slot {} failed", index);
      }
      break;
    }
  }
  return true;
}

void handle_header_button(DemoState& state, const std::string& pane_id, AffordanceRole role) {
  auto& manager = state.manager;
  bool ok = false;
  switch (role) {
  case AffordanceRole::CloseButton:
    ok = manager.on_close_requested(pane_id);
    break;
  case AffordanceRole::MaximizeButton:
    ok = manager.on_maximize_requested(pane_id);
    break;
  case AffordanceRole::MinimizeButton:
    ok = manager.on_minimize_requested(pane_id, MinimizeSource::Icon);
    break;
  case AffordanceRole::DragHandle:
  case AffordanceRole::ResizeHandle:
    break;
  }
  spdlog::trace("{} on '{}': {}", magic_enum::enum_name(role), pane_id, ok ? "done" : "rejected");
}

void handle_mouse_pressed(DemoState& state, const GlobalOptions& options,
                          const session::PointerEvent& event, double now) {
  auto& manager = state.manager;
  geom::Point p = event.position;

  if (event.button == session::PointerButton::Primary &&
      handle_minimize_area_click(state, options.minimizeOptions, p)) {
    return;
  }

  Pane* target = manager.pane_at_point(p);
  if (target == nullptr) {
    return;
  }
  // Copy the id: closing the pane invalidates `target`
  std::string pane_id = target->id;
  float header_height = options.renderOptions.headerHeight;

  if (auto zone = zone_at(*target, p)) {
    bool started = manager.on_pointer_down(pane_id, HitArea::ResizeHandle, zone, event);
    spdlog::trace("resize handle {} on '{}': session {}", magic_enum::enum_name(*zone), pane_id,
                  started);
    return;
  }

  if (!geom::contains_point(header_rect(*target, header_height), p)) {
    bool started = manager.on_pointer_down(pane_id, HitArea::Body, std::nullopt, event);
    spdlog::trace("body of '{}': session {}", pane_id, started);
    return;
  }

  if (auto role = button_at(state, *target, header_height, p)) {
    bool started = manager.on_pointer_down(pane_id, HitArea::Body, std::nullopt, event);
    spdlog::trace("header button of '{}': session {}", pane_id, started);
    if (event.button == session::PointerButton::Primary) {
      handle_header_button(state, pane_id, *role);
    }
    return;
  }

  if (event.button == session::PointerButton::Primary) {
    double elapsed_ms = (now - state.last_header_click_time) * 1000.0;
    if (state.last_header_click_pane == pane_id &&
        elapsed_ms <= static_cast<double>(options.demoOptions.doubleClickMs)) {
      state.last_header_click_pane.reset();
      if (!manager.on_minimize_requested(pane_id, MinimizeSource::DoubleClick)) {
        spdlog::trace("double-click minimize of '{}' rejected", pane_id);
      }
      return;
    }
    state.last_header_click_pane = pane_id;
    state.last_header_click_time = now;
  }

  HitArea area = has_affordance(state, pane_id, AffordanceRole::DragHandle) ? HitArea::DragHandle
                                                                            : HitArea::Body;
  bool started = manager.on_pointer_down(pane_id, area, std::nullopt, event);
  spdlog::trace("header of '{}': session {}", pane_id, started);
}

// ============================================================================
// Drawing
// ============================================================================

const char* button_label(AffordanceRole role) {
  switch (role) {
  case AffordanceRole::CloseButton:
    return "x";
  case AffordanceRole::MaximizeButton:
    return "[]";
  case AffordanceRole::MinimizeButton:
    return "_";
  default:
    return "";
  }
}

void draw_text_in(const std::string& text, const geom::Rect& r, ::Color color) {
  int y = static_cast<int>(r.y + (r.height - static_cast<float>(kTitleFontSize)) / 2.0f);
  DrawText(text.c_str(), static_cast<int>(r.x + kTitlePadding), y, kTitleFontSize, color);
}

void draw_pane(const DemoState& state, const Pane& pane, const RenderOptions& render) {
  auto body = body_rect(pane);
  auto header = header_rect(pane, render.headerHeight);

  if (pane.capabilities.resizable) {
    DrawRectangleRec(to_rectangle(pane_frame(pane)), to_raylib_color(render.headerColor));
  }
  DrawRectangleRec(to_rectangle(body), to_raylib_color(render.paneColor));
  DrawRectangleRec(to_rectangle(header), to_raylib_color(render.headerColor));
  draw_text_in(pane.title, header, RAYWHITE);

  auto buttons = header_buttons(state, pane);
  for (size_t slot = 0; slot < buttons.size(); ++slot) {
    auto r = header_button_rect(pane, render.headerHeight, slot);
    const char* label = button_label(buttons[slot]);
    int text_width = MeasureText(label, kTitleFontSize);
    DrawText(label, static_cast<int>(r.x + (r.width - static_cast<float>(text_width)) / 2.0f),
             static_cast<int>(r.y + (r.height - static_cast<float>(kTitleFontSize)) / 2.0f),
             kTitleFontSize, RAYWHITE);
  }

  bool front = pane.z_tier == ZTier::Front;
  DrawRectangleLinesEx(to_rectangle(body), front ? 2.0f : 1.0f,
                       to_raylib_color(front ? render.frontBorderColor : render.backBorderColor));
}

void draw_minimize_area(const WindowManager& manager, const GlobalOptions& options) {
  const auto& minimize = options.minimizeOptions;
  const auto& render = options.renderOptions;
  const auto& layout = manager.minimized;

  geom::Rect area{0.0f, manager.viewport.height, manager.viewport.width, minimize.areaHeight};
  DrawRectangleRec(to_rectangle(area), to_raylib_color(render.stripColor));

  if (layout.mode == overflow::OverflowMode::Strip) {
    for (size_t k = 0; k < layout.strip_items.size(); ++k) {
      auto r = strip_item_rect(manager, minimize, k);
      DrawRectangleRec(to_rectangle(r), to_raylib_color(render.headerColor));
      draw_text_in(layout.strip_items[k].title, r, RAYWHITE);
    }
    return;
  }

  auto toggle = dropdown_toggle_rect(manager, minimize);
  DrawRectangleRec(to_rectangle(toggle), to_raylib_color(render.headerColor));
  std::string label = std::to_string(layout.dropdown_items.size()) +
                      (layout.dropdown_open ? " v" : " ^");
  draw_text_in(label, toggle, RAYWHITE);

  if (!layout.dropdown_open) {
    return;
  }
  for (size_t k = 0; k < layout.dropdown_items.size(); ++k) {
    auto r = dropdown_item_rect(manager, minimize, k);
    DrawRectangleRec(to_rectangle(r), to_raylib_color(render.paneColor));
    DrawRectangleLinesEx(to_rectangle(r), 1.0f, to_raylib_color(render.backBorderColor));
    draw_text_in(layout.dropdown_items[k].title, r, DARKGRAY);
  }
}

geom::Viewport current_viewport(const GlobalOptions& options) {
  return {static_cast<float>(GetScreenWidth()),
          std::max(0.0f, static_cast<float>(GetScreenHeight()) -
                             options.minimizeOptions.areaHeight)};
}

} // namespace

void run_demo(GlobalOptionsProvider& options_provider) {
  const auto& options = options_provider.options;

  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(options.demoOptions.width, options.demoOptions.height, "pane-wm demo");
  SetTargetFPS(60);

  DemoState state;

  HostCallbacks host;
  host.attach_affordance = [&state](const std::string& pane_id, AffordanceRole role,
                                    std::optional<geom::ResizeZone> zone) {
    auto& roles = state.affordances[pane_id];
    if (std::find(roles.begin(), roles.end(), role) == roles.end()) {
      roles.push_back(role);
    }
    spdlog::trace("attach {} {} to '{}'", magic_enum::enum_name(role),
                  zone.has_value() ? magic_enum::enum_name(*zone) : "", pane_id);
  };
  host.set_pane_visible = [](const std::string& pane_id, bool visible) {
    spdlog::trace("pane '{}' visible={}", pane_id, visible);
  };
  host.detach_pane = [&state](const std::string& pane_id) {
    state.affordances.erase(pane_id);
    if (state.last_header_click_pane == pane_id) {
      state.last_header_click_pane.reset();
    }
  };
  // Items grow to fit their title
  host.measure_minimized_item = [&options_provider](const overflow::ItemView& view) {
    auto metrics = options_provider.options.minimizeOptions.itemMetrics;
    float title_width = static_cast<float>(MeasureText(view.title.c_str(), kTitleFontSize));
    metrics.width = std::max(metrics.width, title_width + 2.0f * kTitlePadding);
    return std::optional<overflow::ItemMetrics>(metrics);
  };

  state.manager.init(current_viewport(options), std::move(host), options.minimizeOptions);

  for (const auto& def : options.panes) {
    try {
      state.manager.register_pane(def.id, def.config);
    } catch (const std::runtime_error& e) {
      spdlog::error("Skipping pane: {}", e.what());
    }
  }
  log_unknown_keys(options.keyboardOptions);

  while (!WindowShouldClose()) {
    // Check for config changes and hot-reload
    if (options_provider.refresh()) {
      state.manager.minimized.resize_tolerance = options.minimizeOptions.resizeTolerance;
      auto viewport = current_viewport(options);
      state.manager.on_viewport_resized(viewport.width, viewport.height);
      log_unknown_keys(options.keyboardOptions);
    }

    if (IsWindowResized()) {
      auto viewport = current_viewport(options);
      state.manager.on_viewport_resized(viewport.width, viewport.height);
    }

    Vector2 mouse_pos = GetMousePosition();
    session::PointerEvent event{geom::Point{mouse_pos.x, mouse_pos.y}};

    if (auto button = pressed_button()) {
      event.button = *button;
      handle_mouse_pressed(state, options, event, GetTime());
    }
    if (state.manager.sessions.is_active()) {
      state.manager.on_pointer_move(event);
    }
    if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
      state.manager.on_pointer_up(event);
    }

    // Keyboard actions
    for (const auto& binding : options.keyboardOptions.bindings) {
      auto key = key_from_name(binding.key);
      if (key.has_value() && IsKeyPressed(*key)) {
        auto result = state.manager.process_action(binding.action);
        spdlog::debug("{} -> {}", magic_enum::enum_name(binding.action),
                      result.success ? "ok" : "rejected");
      }
    }

    // Drawing
    BeginDrawing();
    ClearBackground(RAYWHITE);

    for (size_t index : state.manager.stacking_order()) {
      const Pane& pane = state.manager.panes[index];
      if (pane.visible) {
        draw_pane(state, pane, options.renderOptions);
      }
    }
    draw_minimize_area(state.manager, options);

    EndDrawing();
  }

  CloseWindow();
}

} // namespace panewm

#endif
