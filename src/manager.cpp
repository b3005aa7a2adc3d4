#include "manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>
#include <set>
#include <stdexcept>

#include "lifecycle.h"
#include "utility.h"
#include "zorder.h"

namespace panewm {

namespace {

bool has_viewport(const geom::Viewport& viewport) {
  return viewport.width > 0.0f && viewport.height > 0.0f;
}

geom::Rect initial_rect(const PaneConfig& config) {
  geom::Rect rect = config.initial_rect.value_or(geom::Rect{});
  if (rect.width <= 0.0f) {
    rect.width = geom::kDefaultPaneWidth;
  }
  if (rect.height <= 0.0f) {
    rect.height = geom::kDefaultPaneHeight;
  }
  rect.width = std::max(rect.width, geom::kMinPaneWidth);
  rect.height = std::max(rect.height, geom::kMinPaneHeight);
  return rect;
}

void attach_affordances(const HostCallbacks& host, const Pane& pane) {
  if (!host.attach_affordance) {
    return;
  }
  if (pane.capabilities.draggable) {
    host.attach_affordance(pane.id, AffordanceRole::DragHandle, std::nullopt);
  }
  if (pane.capabilities.resizable) {
    for (auto zone : magic_enum::enum_values<geom::ResizeZone>()) {
      host.attach_affordance(pane.id, AffordanceRole::ResizeHandle, zone);
    }
  }
  if (pane.capabilities.minimizable && pane.triggers.min_max_icons) {
    host.attach_affordance(pane.id, AffordanceRole::MinimizeButton, std::nullopt);
    host.attach_affordance(pane.id, AffordanceRole::MaximizeButton, std::nullopt);
  }
  if (pane.capabilities.closable && pane.triggers.close_icon) {
    host.attach_affordance(pane.id, AffordanceRole::CloseButton, std::nullopt);
  }
}

void notify_visible(const HostCallbacks& host, const Pane& pane) {
  if (host.set_pane_visible) {
    host.set_pane_visible(pane.id, pane.visible);
  }
}

bool trigger_enabled(const Pane& pane, MinimizeSource source) {
  switch (source) {
  case MinimizeSource::Icon:
    return pane.triggers.min_max_icons;
  case MinimizeSource::DoubleClick:
    return pane.triggers.minimize_on_double_click;
  case MinimizeSource::Keyboard:
    return true;
  }
  return false;
}

} // namespace

void WindowManager::init(const geom::Viewport& initial_viewport, HostCallbacks callbacks,
                         const MinimizeOptions& minimize_options) {
  viewport = initial_viewport;
  host = std::move(callbacks);

  minimized = overflow::OverflowLayout{};
  minimized.area_width = viewport.width;
  minimized.resize_tolerance = minimize_options.resizeTolerance;
  if (host.measure_minimized_item) {
    minimized.measure_item = host.measure_minimized_item;
  } else {
    auto metrics = minimize_options.itemMetrics;
    minimized.measure_item = [metrics](const overflow::ItemView&) {
      return std::optional<overflow::ItemMetrics>(metrics);
    };
  }
}

Pane& WindowManager::register_pane(const std::string& id, const PaneConfig& config) {
  if (id.empty()) {
    throw std::runtime_error("WindowManager: pane id must not be empty");
  }
  if (find_pane(id) != nullptr) {
    throw std::runtime_error("WindowManager: duplicate pane id '" + id + "'");
  }

  Pane pane;
  pane.id = id;
  pane.title = config.title.empty() ? id : config.title;
  pane.capabilities = config.capabilities;
  pane.triggers = config.triggers;
  pane.rect = initial_rect(config);
  if (has_viewport(viewport)) {
    pane.rect = geom::contain_in_viewport(pane.rect, viewport, frame_margin(pane));
  }
  pane.z_tier = zorder::initial_tier(pane);

  panes.push_back(std::move(pane));
  Pane& registered = panes.back();
  attach_affordances(host, registered);

  spdlog::info("register: '{}' at ({}, {}) {}x{}", registered.id, registered.rect.x,
               registered.rect.y, registered.rect.width, registered.rect.height);
  return registered;
}

Pane* WindowManager::find_pane(const std::string& id) {
  auto it = std::find_if(panes.begin(), panes.end(), [&](const Pane& p) { return p.id == id; });
  return it != panes.end() ? &*it : nullptr;
}

const Pane* WindowManager::find_pane(const std::string& id) const {
  auto it = std::find_if(panes.begin(), panes.end(), [&](const Pane& p) { return p.id == id; });
  return it != panes.end() ? &*it : nullptr;
}

Pane& WindowManager::pane(const std::string& id) {
  Pane* p = find_pane(id);
  if (p == nullptr) {
    throw std::runtime_error("WindowManager: unknown pane id '" + id + "'");
  }
  return *p;
}

const Pane& WindowManager::pane(const std::string& id) const {
  const Pane* p = find_pane(id);
  if (p == nullptr) {
    throw std::runtime_error("WindowManager: unknown pane id '" + id + "'");
  }
  return *p;
}

// ============================================================================
// Pointer events
// ============================================================================

bool WindowManager::on_pointer_down(const std::string& pane_id, HitArea area,
                                    std::optional<geom::ResizeZone> zone,
                                    const session::PointerEvent& event) {
  Pane& target = pane(pane_id);
  if (target.state == PaneState::Minimized) {
    spdlog::debug("pointer down on minimized pane '{}' ignored", pane_id);
    return false;
  }

  zorder::bring_to_front(panes, pane_id);

  switch (area) {
  case HitArea::Body:
    return false;
  case HitArea::DragHandle:
    if (!target.capabilities.draggable) {
      spdlog::debug("pane '{}' is not draggable", pane_id);
      return false;
    }
    return sessions.begin(pane_id, session::SessionMode::Move, std::nullopt, event);
  case HitArea::ResizeHandle:
    if (!target.capabilities.resizable) {
      spdlog::debug("pane '{}' is not resizable", pane_id);
      return false;
    }
    return sessions.begin(pane_id, session::SessionMode::Resize, zone, event);
  }
  return false;
}

bool WindowManager::on_pointer_move(const session::PointerEvent& event) {
  if (!sessions.is_active()) {
    return false;
  }

  Pane& target = pane(sessions.active->target_pane_id);
  auto step = sessions.step(event, target.rect, viewport, frame_margin(target));
  if (!step.has_value() || step->rect == target.rect) {
    return false;
  }
  target.rect = step->rect;
  return true;
}

bool WindowManager::on_pointer_up(const session::PointerEvent&) {
  return sessions.end();
}

// ============================================================================
// Lifecycle events
// ============================================================================

bool WindowManager::on_minimize_requested(const std::string& pane_id, MinimizeSource source) {
  Pane& target = pane(pane_id);

  if (!trigger_enabled(target, source)) {
    spdlog::debug("minimize: {} trigger disabled for '{}'", magic_enum::enum_name(source),
                  pane_id);
    return false;
  }
  if (target.state == PaneState::Minimized) {
    // Double-click and icon click can both fire for a single gesture
    spdlog::trace("minimize: '{}' already minimized", pane_id);
    return false;
  }
  if (!lifecycle::minimize(target)) {
    return false;
  }

  minimized.enqueue(target.id, target.title);
  notify_visible(host, target);
  spdlog::info("minimize: '{}' ({} minimized, {})", pane_id, minimized.live_count(),
               magic_enum::enum_name(minimized.mode));
  return true;
}

bool WindowManager::on_maximize_requested(const std::string& pane_id) {
  Pane& target = pane(pane_id);

  if (target.state == PaneState::Maximized) {
    if (!lifecycle::restore(target)) {
      return false;
    }
    lifecycle::contain(target, viewport);
    spdlog::info("restore: '{}' to ({}, {}) {}x{}", pane_id, target.rect.x, target.rect.y,
                 target.rect.width, target.rect.height);
    return true;
  }

  if (!lifecycle::maximize(target, viewport)) {
    return false;
  }
  spdlog::info("maximize: '{}' to {}x{}", pane_id, target.rect.width, target.rect.height);
  return true;
}

bool WindowManager::on_close_requested(const std::string& pane_id) {
  Pane& target = pane(pane_id);

  if (!target.capabilities.closable) {
    spdlog::warn("close: pane '{}' is not closable", pane_id);
    return false;
  }
  if (sessions.targets(pane_id)) {
    spdlog::warn("close: pane '{}' has an active {} session", pane_id,
                 magic_enum::enum_name(sessions.active->mode));
    return false;
  }

  if (target.state == PaneState::Minimized) {
    minimized.release(pane_id);
  }
  lifecycle::release(target);
  if (host.detach_pane) {
    host.detach_pane(pane_id);
  }

  panes.erase(std::remove_if(panes.begin(), panes.end(),
                             [&](const Pane& p) { return p.id == pane_id; }),
              panes.end());
  spdlog::info("close: '{}' ({} panes left)", pane_id, panes.size());
  return true;
}

bool WindowManager::on_restore_requested(size_t minimized_index) {
  overflow::MinimizedEntry entry = minimized.restore(minimized_index);
  Pane& target = pane(entry.pane_id);

  if (!lifecycle::unminimize(target)) {
    return false;
  }
  notify_visible(host, target);
  spdlog::info("unminimize: '{}' from slot {} ({} minimized)", entry.pane_id, minimized_index,
               minimized.live_count());
  return true;
}

// ============================================================================
// Resize events
// ============================================================================

void WindowManager::on_viewport_resized(float width, float height) {
  viewport = geom::Viewport{width, height};
  timed_void("contain panes", [&]() {
    for (auto& p : panes) {
      lifecycle::contain(p, viewport);
    }
  });
  minimized.on_area_resized(width);
  spdlog::debug("viewport: {}x{}", width, height);
}

void WindowManager::on_minimize_area_resized(float width) {
  minimized.on_area_resized(width);
}

// ============================================================================
// Actions and queries
// ============================================================================

ActionResult WindowManager::process_action(PaneAction action) {
  ActionResult result;
  spdlog::debug("action: {}", magic_enum::enum_name(action));

  switch (action) {
  case PaneAction::MinimizeFocused:
  case PaneAction::ToggleMaximizeFocused:
  case PaneAction::CloseFocused: {
    Pane* focused = focused_pane();
    if (focused == nullptr) {
      spdlog::debug("action: no focused pane");
      return result;
    }
    std::string id = focused->id;
    result.pane_id = id;
    if (action == PaneAction::MinimizeFocused) {
      result.success = on_minimize_requested(id, MinimizeSource::Keyboard);
    } else if (action == PaneAction::ToggleMaximizeFocused) {
      result.success = on_maximize_requested(id);
    } else {
      result.success = on_close_requested(id);
    }
    break;
  }
  case PaneAction::RestoreNewest: {
    auto index = minimized.newest_index();
    if (!index.has_value()) {
      return result;
    }
    result.pane_id = minimized.registry[*index]->pane_id;
    result.success = on_restore_requested(*index);
    break;
  }
  case PaneAction::ToggleDropdown:
    result.success = minimized.toggle_dropdown();
    break;
  case PaneAction::DebugPrint:
    debug_print();
    result.success = true;
    break;
  case PaneAction::Validate:
    result.success = validate();
    break;
  }
  return result;
}

Pane* WindowManager::focused_pane() {
  for (auto& p : panes) {
    if (p.z_tier == ZTier::Front && p.state != PaneState::Minimized) {
      return &p;
    }
  }
  return nullptr;
}

Pane* WindowManager::pane_at_point(geom::Point p) {
  auto index = zorder::topmost_at(panes, p);
  return index.has_value() ? &panes[*index] : nullptr;
}

std::vector<size_t> WindowManager::stacking_order() const {
  return zorder::stacking_order(panes);
}

void WindowManager::debug_print() const {
  spdlog::debug("===== WindowManager =====");
  spdlog::debug("viewport: {}x{}", viewport.width, viewport.height);
  spdlog::debug("panes: {}", panes.size());
  for (const auto& p : panes) {
    spdlog::debug("  '{}' \"{}\": ({}, {}) {}x{} state={} tier={} visible={}", p.id, p.title,
                  p.rect.x, p.rect.y, p.rect.width, p.rect.height,
                  magic_enum::enum_name(p.state), magic_enum::enum_name(p.z_tier), p.visible);
    if (p.saved_rect.has_value()) {
      spdlog::debug("    saved: ({}, {}) {}x{}", p.saved_rect->x, p.saved_rect->y,
                    p.saved_rect->width, p.saved_rect->height);
    }
  }

  if (sessions.active.has_value()) {
    const auto& s = *sessions.active;
    spdlog::debug("session: {} '{}' last=({}, {})", magic_enum::enum_name(s.mode),
                  s.target_pane_id, s.last_pointer.x, s.last_pointer.y);
  } else {
    spdlog::debug("session: idle");
  }

  spdlog::debug("minimized: mode={} area={} capacity={} open={}",
                magic_enum::enum_name(minimized.mode), minimized.area_width,
                minimized.item_capacity.has_value()
                    ? std::to_string(*minimized.item_capacity)
                    : std::string("unknown"),
                minimized.dropdown_open);
  for (size_t i = 0; i < minimized.registry.size(); ++i) {
    const auto& slot = minimized.registry[i];
    if (slot.has_value()) {
      spdlog::debug("  [{}] '{}'", i, slot->pane_id);
    } else {
      spdlog::debug("  [{}] <empty>", i);
    }
  }
  spdlog::debug("===== End WindowManager =====");
}

bool WindowManager::validate() const {
  bool ok = true;

  std::set<std::string> ids;
  size_t front_count = 0;
  for (const auto& p : panes) {
    if (!ids.insert(p.id).second) {
      spdlog::error("[validate] ERROR: duplicate pane id '{}'", p.id);
      ok = false;
    }
    if (p.z_tier == ZTier::Front) {
      ++front_count;
    }
    if (p.saved_rect.has_value() != (p.state == PaneState::Maximized)) {
      spdlog::error("[validate] ERROR: pane '{}' is {} but saved_rect is {}", p.id,
                    magic_enum::enum_name(p.state), p.saved_rect.has_value() ? "set" : "unset");
      ok = false;
    }
    if (p.visible == (p.state == PaneState::Minimized)) {
      spdlog::error("[validate] ERROR: pane '{}' is {} but visible={}", p.id,
                    magic_enum::enum_name(p.state), p.visible);
      ok = false;
    }
    if (p.rect.width < geom::kMinPaneWidth || p.rect.height < geom::kMinPaneHeight) {
      spdlog::error("[validate] ERROR: pane '{}' is below the minimum size ({}x{})", p.id,
                    p.rect.width, p.rect.height);
      ok = false;
    }
    if (has_viewport(viewport) && !geom::is_contained(pane_frame(p), viewport)) {
      spdlog::error("[validate] ERROR: pane '{}' frame leaves the {}x{} viewport", p.id,
                    viewport.width, viewport.height);
      ok = false;
    }
    bool listed = minimized.find_index(p.id).has_value();
    if (listed != (p.state == PaneState::Minimized)) {
      spdlog::error("[validate] ERROR: pane '{}' is {} but {} in the minimized registry", p.id,
                    magic_enum::enum_name(p.state), listed ? "listed" : "missing");
      ok = false;
    }
  }

  if (front_count > 1) {
    spdlog::error("[validate] ERROR: {} panes in the Front tier", front_count);
    ok = false;
  }

  std::set<std::string> minimized_ids;
  for (const auto& slot : minimized.registry) {
    if (!slot.has_value()) {
      continue;
    }
    if (!minimized_ids.insert(slot->pane_id).second) {
      spdlog::error("[validate] ERROR: pane '{}' minimized twice", slot->pane_id);
      ok = false;
    }
    if (find_pane(slot->pane_id) == nullptr) {
      spdlog::error("[validate] ERROR: minimized entry for unknown pane '{}'", slot->pane_id);
      ok = false;
    }
  }

  for (const auto& view : minimized.visible_items()) {
    if (view.index >= minimized.registry.size() || !minimized.registry[view.index].has_value()) {
      spdlog::error("[validate] ERROR: {} item {} has no registry entry",
                    magic_enum::enum_name(minimized.mode), view.index);
      ok = false;
    }
  }
  if (minimized.visible_items().size() != minimized.live_count()) {
    spdlog::error("[validate] ERROR: {} shows {} items for {} entries",
                  magic_enum::enum_name(minimized.mode), minimized.visible_items().size(),
                  minimized.live_count());
    ok = false;
  }

  if (sessions.active.has_value() && find_pane(sessions.active->target_pane_id) == nullptr) {
    spdlog::error("[validate] ERROR: session targets unknown pane '{}'",
                  sessions.active->target_pane_id);
    ok = false;
  }

  if (ok) {
    spdlog::debug("[validate] WindowManager OK");
  } else {
    spdlog::warn("[validate] WindowManager has anomalies");
  }
  return ok;
}

} // namespace panewm
