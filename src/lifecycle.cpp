#include "lifecycle.h"

#include <spdlog/spdlog.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace panewm::lifecycle {

geom::Rect maximized_rect(const Pane& pane, const geom::Viewport& viewport) {
  float margin = frame_margin(pane);
  return {0.0f, 0.0f, std::max(geom::kMinPaneWidth, viewport.width - margin),
          std::max(geom::kMinPaneHeight, viewport.height - margin)};
}

bool minimize(Pane& pane) {
  if (!pane.capabilities.minimizable) {
    spdlog::warn("minimize: pane '{}' is not minimizable", pane.id);
    return false;
  }
  if (pane.state != PaneState::Normal) {
    spdlog::warn("minimize: pane '{}' is {}, expected Normal", pane.id,
                 magic_enum::enum_name(pane.state));
    return false;
  }

  pane.state = PaneState::Minimized;
  pane.visible = false;
  return true;
}

bool unminimize(Pane& pane) {
  if (pane.state != PaneState::Minimized) {
    spdlog::warn("unminimize: pane '{}' is {}, expected Minimized", pane.id,
                 magic_enum::enum_name(pane.state));
    return false;
  }

  pane.state = PaneState::Normal;
  pane.visible = true;
  return true;
}

bool maximize(Pane& pane, const geom::Viewport& viewport) {
  if (!pane.capabilities.minimizable) {
    spdlog::warn("maximize: pane '{}' is not maximizable", pane.id);
    return false;
  }
  if (pane.state != PaneState::Normal) {
    spdlog::warn("maximize: pane '{}' is {}, expected Normal", pane.id,
                 magic_enum::enum_name(pane.state));
    return false;
  }

  pane.saved_rect = pane.rect;
  pane.rect = maximized_rect(pane, viewport);
  pane.state = PaneState::Maximized;
  return true;
}

bool restore(Pane& pane) {
  if (pane.state != PaneState::Maximized || !pane.saved_rect.has_value()) {
    spdlog::warn("restore: pane '{}' is {}, expected Maximized", pane.id,
                 magic_enum::enum_name(pane.state));
    return false;
  }

  pane.rect = *pane.saved_rect;
  pane.saved_rect.reset();
  pane.state = PaneState::Normal;
  return true;
}

void contain(Pane& pane, const geom::Viewport& viewport) {
  float margin = frame_margin(pane);
  if (pane.state == PaneState::Maximized) {
    pane.rect = maximized_rect(pane, viewport);
  } else {
    pane.rect = geom::contain_in_viewport(pane.rect, viewport, margin);
  }
  if (pane.saved_rect.has_value()) {
    pane.saved_rect = geom::contain_in_viewport(*pane.saved_rect, viewport, margin);
  }
}

void release(Pane& pane) {
  pane.saved_rect.reset();
  pane.visible = false;
}

} // namespace panewm::lifecycle
