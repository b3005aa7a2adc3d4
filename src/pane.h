#pragma once

#include <optional>
#include <string>

#include "geometry.h"

namespace panewm {

// What a pane is allowed to do. Minimizable covers both minimize and maximize.
struct Capabilities {
  bool draggable = true;
  bool resizable = true;
  bool closable = true;
  bool minimizable = true;
};

// Which host controls trigger lifecycle actions for a pane
struct TriggerOptions {
  bool min_max_icons = true;
  bool minimize_on_double_click = true;
  bool close_icon = true;
};

enum class PaneState { Normal, Minimized, Maximized };

// Coarse stacking bucket. Inherit marks a pane that is not elevated on its own
// (it has no resize container to carry a stacking level).
enum class ZTier { Inherit, Back, Front };

// Registration parameters for a pane
struct PaneConfig {
  Capabilities capabilities;
  TriggerOptions triggers;
  std::string title;
  std::optional<geom::Rect> initial_rect; // Default size at (0,0) when empty
};

struct Pane {
  std::string id;
  std::string title;
  Capabilities capabilities;
  TriggerOptions triggers;

  geom::Rect rect;
  std::optional<geom::Rect> saved_rect; // Set only while Maximized

  PaneState state = PaneState::Normal;
  ZTier z_tier = ZTier::Inherit;
  bool visible = true;
};

// Handle margin added around the pane by its resize container (0 when not resizable).
[[nodiscard]] inline float frame_margin(const Pane& pane) {
  return pane.capabilities.resizable ? geom::kEdgeMargin : 0.0f;
}

// Rectangle occupied by the pane including its resize container.
[[nodiscard]] inline geom::Rect pane_frame(const Pane& pane) {
  return geom::frame_rect(pane.rect, frame_margin(pane));
}

} // namespace panewm
