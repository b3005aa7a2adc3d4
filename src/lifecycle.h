#pragma once

#include "geometry.h"
#include "pane.h"

namespace panewm::lifecycle {

// Geometry of a pane filling the viewport. Resizable panes keep room for
// their handles inside the viewport.
[[nodiscard]] geom::Rect maximized_rect(const Pane& pane, const geom::Viewport& viewport);

// Normal -> Minimized. Hides the pane, leaves its geometry untouched.
// Returns false (and changes nothing) from any other state or without the capability.
[[nodiscard]] bool minimize(Pane& pane);

// Minimized -> Normal. Shows the pane again with its untouched geometry.
[[nodiscard]] bool unminimize(Pane& pane);

// Normal -> Maximized. Snapshots the current rect into saved_rect.
[[nodiscard]] bool maximize(Pane& pane, const geom::Viewport& viewport);

// Maximized -> Normal. Restores rect from saved_rect and clears it.
[[nodiscard]] bool restore(Pane& pane);

// Re-apply viewport containment to the pane and to its saved geometry.
// A maximized pane is refitted to the new viewport.
void contain(Pane& pane, const geom::Viewport& viewport);

// Drop any state owned by the pane ahead of closing it.
void release(Pane& pane);

} // namespace panewm::lifecycle
