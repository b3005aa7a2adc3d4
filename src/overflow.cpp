#include "overflow.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace panewm::overflow {

// ============================================================================
// Internal Helpers
// ============================================================================

namespace {

// Both a double-click and a bubbled click can enqueue the same minimize.
bool is_duplicate_tail(const OverflowLayout& layout) {
  size_t n = layout.registry.size();
  if (n < 2) {
    return false;
  }
  const auto& previous = layout.registry[n - 2];
  const auto& last = layout.registry[n - 1];
  return previous.has_value() && last.has_value() && previous->pane_id == last->pane_id;
}

// Recompute item_capacity from the cached item width. With `remeasure` the
// first rendered strip item is measured again (when the host can measure it).
void refresh_capacity(OverflowLayout& layout, bool remeasure) {
  if ((remeasure || !layout.item_outer_width.has_value()) && !layout.strip_items.empty() &&
      layout.measure_item) {
    auto metrics = layout.measure_item(layout.strip_items.front());
    if (metrics.has_value() && outer_width(*metrics) > 0.0f) {
      layout.item_outer_width = outer_width(*metrics);
    }
  }

  if (!layout.item_outer_width.has_value()) {
    layout.item_capacity.reset();
    return;
  }
  float fit = std::floor(std::max(0.0f, layout.area_width) / *layout.item_outer_width);
  layout.item_capacity = static_cast<size_t>(fit);
}

bool exceeds_capacity(const OverflowLayout& layout, size_t count, size_t tolerance) {
  return layout.item_capacity.has_value() && count > *layout.item_capacity + tolerance;
}

void compact_registry(OverflowLayout& layout) {
  auto& reg = layout.registry;
  reg.erase(std::remove_if(reg.begin(), reg.end(),
                           [](const std::optional<MinimizedEntry>& slot) {
                             return !slot.has_value();
                           }),
            reg.end());
}

void rebuild_strip(OverflowLayout& layout) {
  layout.strip_items.clear();
  for (size_t i = 0; i < layout.registry.size(); ++i) {
    if (layout.registry[i].has_value()) {
      layout.strip_items.push_back({i, layout.registry[i]->title});
    }
  }
}

void enter_dropdown(OverflowLayout& layout) {
  layout.strip_items.clear();
  layout.dropdown_items.clear();
  for (size_t i = 0; i < layout.registry.size(); ++i) {
    if (layout.registry[i].has_value()) {
      layout.dropdown_items.push_back({i, layout.registry[i]->title});
    }
  }
  layout.dropdown_open = false;
  layout.mode = OverflowMode::Dropdown;
  spdlog::info("minimize area: {} items exceed capacity {}, switching to dropdown",
               layout.dropdown_items.size(),
               layout.item_capacity.has_value() ? *layout.item_capacity : 0);
}

void leave_dropdown(OverflowLayout& layout) {
  layout.dropdown_items.clear();
  layout.dropdown_open = false;
  compact_registry(layout);
  rebuild_strip(layout);
  layout.mode = OverflowMode::Strip;
  spdlog::info("minimize area: {} items fit, switching to strip", layout.strip_items.size());
}

void erase_view(std::vector<ItemView>& views, size_t index) {
  views.erase(std::remove_if(views.begin(), views.end(),
                             [&](const ItemView& v) { return v.index == index; }),
              views.end());
}

} // namespace

// ============================================================================
// OverflowLayout
// ============================================================================

EnqueueResult OverflowLayout::enqueue(const std::string& pane_id, const std::string& title) {
  registry.push_back(MinimizedEntry{pane_id, title});

  if (is_duplicate_tail(*this)) {
    registry.pop_back();
    spdlog::debug("minimize area: duplicate entry for '{}' discarded", pane_id);
    return EnqueueResult::Duplicate;
  }

  size_t index = registry.size() - 1;
  if (mode == OverflowMode::Dropdown) {
    dropdown_items.push_back({index, title});
    return EnqueueResult::Added;
  }

  refresh_capacity(*this, false);
  if (exceeds_capacity(*this, registry.size(), 0)) {
    enter_dropdown(*this);
  } else {
    strip_items.push_back({index, title});
  }
  return EnqueueResult::Added;
}

MinimizedEntry OverflowLayout::restore(size_t index) {
  if (index >= registry.size() || !registry[index].has_value()) {
    throw std::out_of_range("OverflowLayout: no minimized entry at index " +
                            std::to_string(index));
  }

  MinimizedEntry entry = *registry[index];
  // Empty the slot first so indices stay aligned with the rendered items
  registry[index].reset();

  if (mode == OverflowMode::Strip) {
    erase_view(strip_items, index);
    if (strip_items.empty()) {
      registry.clear();
    } else {
      for (size_t i = 0; i < strip_items.size(); ++i) {
        strip_items[i].index = i;
      }
      for (size_t j = registry.size(); j > 0; --j) {
        if (!registry[j - 1].has_value()) {
          registry.erase(registry.begin() + static_cast<std::ptrdiff_t>(j - 1));
        }
      }
    }
  } else {
    erase_view(dropdown_items, index);
    if (item_capacity.has_value() && live_count() <= *item_capacity) {
      leave_dropdown(*this);
    }
  }

  return entry;
}

bool OverflowLayout::release(const std::string& pane_id) {
  auto index = find_index(pane_id);
  if (!index.has_value()) {
    return false;
  }
  restore(*index);
  return true;
}

void OverflowLayout::on_area_resized(float width) {
  area_width = width;

  if (mode == OverflowMode::Strip) {
    refresh_capacity(*this, true);
    if (exceeds_capacity(*this, registry.size(), resize_tolerance)) {
      enter_dropdown(*this);
    }
  } else {
    refresh_capacity(*this, false);
    // Emptied slots still count here; only removal compacts them.
    if (item_capacity.has_value() && registry.size() <= *item_capacity) {
      leave_dropdown(*this);
    }
  }
}

bool OverflowLayout::toggle_dropdown() {
  if (mode != OverflowMode::Dropdown) {
    return false;
  }
  dropdown_open = !dropdown_open;
  return true;
}

size_t OverflowLayout::live_count() const {
  return static_cast<size_t>(
      std::count_if(registry.begin(), registry.end(),
                    [](const std::optional<MinimizedEntry>& slot) { return slot.has_value(); }));
}

std::optional<size_t> OverflowLayout::find_index(const std::string& pane_id) const {
  for (size_t i = 0; i < registry.size(); ++i) {
    if (registry[i].has_value() && registry[i]->pane_id == pane_id) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<size_t> OverflowLayout::newest_index() const {
  for (size_t j = registry.size(); j > 0; --j) {
    if (registry[j - 1].has_value()) {
      return j - 1;
    }
  }
  return std::nullopt;
}

const std::vector<ItemView>& OverflowLayout::visible_items() const {
  return mode == OverflowMode::Strip ? strip_items : dropdown_items;
}

} // namespace panewm::overflow
