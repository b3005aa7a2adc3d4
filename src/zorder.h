#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pane.h"

namespace panewm::zorder {

constexpr int kFrontZIndex = 2;
constexpr int kBackZIndex = 1;
constexpr int kInheritZIndex = 0;

// Tier a pane starts with before any interaction.
[[nodiscard]] ZTier initial_tier(const Pane& pane);

// Tier a pane falls back to when another pane is brought to front.
[[nodiscard]] ZTier demoted_tier(const Pane& pane);

[[nodiscard]] int z_index(const Pane& pane);

// Promote the pane with the given id to Front and demote every other pane.
// Returns false if no pane has that id (no tier is touched in that case).
bool bring_to_front(std::vector<Pane>& panes, const std::string& pane_id);

// Indices of panes sorted bottom-to-top. Ties keep registration order.
[[nodiscard]] std::vector<size_t> stacking_order(const std::vector<Pane>& panes);

// Top-most visible pane whose frame contains the point.
[[nodiscard]] std::optional<size_t> topmost_at(const std::vector<Pane>& panes, geom::Point p);

} // namespace panewm::zorder
