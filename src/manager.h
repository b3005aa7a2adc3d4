#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"
#include "options.h"
#include "overflow.h"
#include "pane.h"
#include "session.h"

namespace panewm {

// Interactive parts a host attaches to a pane at registration
enum class AffordanceRole { DragHandle, ResizeHandle, MinimizeButton, MaximizeButton, CloseButton };

// Part of a pane that received a pointer-down
enum class HitArea { Body, DragHandle, ResizeHandle };

// What asked for a minimize. Keyboard requests bypass the trigger configuration.
enum class MinimizeSource { Icon, DoubleClick, Keyboard };

// Callbacks into the host surface. Every callback is optional.
struct HostCallbacks {
  std::function<void(const std::string&, AffordanceRole, std::optional<geom::ResizeZone>)>
      attach_affordance;
  std::function<void(const std::string&, bool)> set_pane_visible;
  std::function<void(const std::string&)> detach_pane;
  overflow::MeasureItemFn measure_minimized_item;
};

// Result of processing an action
struct ActionResult {
  bool success = false;
  std::optional<std::string> pane_id; // Pane the action applied to
};

// WindowManager owns every pane, the active drag session and the minimized
// registry, and routes host events to them.
// All members are public for easy access
struct WindowManager {
  geom::Viewport viewport;
  std::vector<Pane> panes;
  session::SessionController sessions;
  overflow::OverflowLayout minimized;
  HostCallbacks host;

  // Set up viewport, host callbacks and the minimize area. Without a host
  // measure callback the configured item metrics are used.
  void init(const geom::Viewport& initial_viewport, HostCallbacks callbacks,
            const MinimizeOptions& minimize_options = {});

  // Register a pane. Its rect defaults to 200x150 at (0,0) and is contained in
  // the viewport. Throws std::runtime_error for an empty or duplicate id.
  // The returned reference is valid until the next registration or close.
  Pane& register_pane(const std::string& id, const PaneConfig& config);

  [[nodiscard]] Pane* find_pane(const std::string& id);
  [[nodiscard]] const Pane* find_pane(const std::string& id) const;

  // Throws std::runtime_error if no pane has the id
  [[nodiscard]] Pane& pane(const std::string& id);
  [[nodiscard]] const Pane& pane(const std::string& id) const;

  // ==========================================================================
  // Pointer events
  // ==========================================================================

  // Bring the pane to front, then start a move (DragHandle) or resize
  // (ResizeHandle + zone) session when the pane allows it.
  // Returns true if a session started.
  [[nodiscard]] bool on_pointer_down(const std::string& pane_id, HitArea area,
                                     std::optional<geom::ResizeZone> zone,
                                     const session::PointerEvent& event);

  // Advance the active session. Returns true if the target pane's rect changed.
  bool on_pointer_move(const session::PointerEvent& event);

  // End the active session wherever the pointer is. Returns false if idle.
  bool on_pointer_up(const session::PointerEvent& event);

  // ==========================================================================
  // Lifecycle events
  // ==========================================================================

  [[nodiscard]] bool on_minimize_requested(const std::string& pane_id, MinimizeSource source);

  // Toggle between Normal and Maximized
  [[nodiscard]] bool on_maximize_requested(const std::string& pane_id);

  [[nodiscard]] bool on_close_requested(const std::string& pane_id);

  // Restore the pane shown under the given minimized index.
  // Throws std::out_of_range for an empty or unknown slot.
  [[nodiscard]] bool on_restore_requested(size_t minimized_index);

  // ==========================================================================
  // Resize events
  // ==========================================================================

  // Contain every pane in the new viewport, then re-lay out the minimize area
  // (which spans the viewport width).
  void on_viewport_resized(float width, float height);

  void on_minimize_area_resized(float width);

  // ==========================================================================
  // Actions and queries
  // ==========================================================================

  [[nodiscard]] ActionResult process_action(PaneAction action);

  // The Front pane, unless it is minimized
  [[nodiscard]] Pane* focused_pane();

  // Top-most visible pane whose frame contains the point
  [[nodiscard]] Pane* pane_at_point(geom::Point p);

  // Pane indices bottom-to-top
  [[nodiscard]] std::vector<size_t> stacking_order() const;

  // Dump the manager state at debug level
  void debug_print() const;

  // Check internal consistency, logging every anomaly. Returns true if consistent.
  [[nodiscard]] bool validate() const;
};

} // namespace panewm
