#include "zorder.h"

#include <algorithm>
#include <numeric>

namespace panewm::zorder {

ZTier initial_tier(const Pane& pane) {
  return demoted_tier(pane);
}

ZTier demoted_tier(const Pane& pane) {
  // The resize container is the stacking context for resizable panes
  return pane.capabilities.resizable ? ZTier::Back : ZTier::Inherit;
}

int z_index(const Pane& pane) {
  switch (pane.z_tier) {
  case ZTier::Front:
    return kFrontZIndex;
  case ZTier::Back:
    return kBackZIndex;
  case ZTier::Inherit:
    return kInheritZIndex;
  }
  return kInheritZIndex;
}

bool bring_to_front(std::vector<Pane>& panes, const std::string& pane_id) {
  auto it = std::find_if(panes.begin(), panes.end(),
                         [&](const Pane& pane) { return pane.id == pane_id; });
  if (it == panes.end()) {
    return false;
  }

  for (auto& pane : panes) {
    pane.z_tier = (pane.id == pane_id) ? ZTier::Front : demoted_tier(pane);
  }
  return true;
}

std::vector<size_t> stacking_order(const std::vector<Pane>& panes) {
  std::vector<size_t> order(panes.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return z_index(panes[a]) < z_index(panes[b]); });
  return order;
}

std::optional<size_t> topmost_at(const std::vector<Pane>& panes, geom::Point p) {
  auto order = stacking_order(panes);
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    const Pane& pane = panes[*it];
    if (pane.visible && geom::contains_point(pane_frame(pane), p)) {
      return *it;
    }
  }
  return std::nullopt;
}

} // namespace panewm::zorder
