#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace panewm::overflow {

// One minimized pane. The registry slot index doubles as its display identifier.
struct MinimizedEntry {
  std::string pane_id;
  std::string title;
};

enum class OverflowMode { Strip, Dropdown };

// Rendered size of one strip item
struct ItemMetrics {
  float width = 0.0f;
  float margin_left = 0.0f;
  float margin_right = 0.0f;
};

[[nodiscard]] inline float outer_width(const ItemMetrics& m) {
  return m.width + m.margin_left + m.margin_right;
}

// A rendered representation (strip item or dropdown item)
struct ItemView {
  size_t index; // Registry slot, used as the representation id
  std::string title;
};

enum class EnqueueResult { Added, Duplicate };

// Measures a rendered strip item. Returning nullopt leaves the capacity unknown.
using MeasureItemFn = std::function<std::optional<ItemMetrics>(const ItemView&)>;

constexpr size_t kDefaultResizeTolerance = 1;

// Ordered registry of minimized panes and its strip/dropdown presentation.
// All members are public for easy access by hosts and tests.
struct OverflowLayout {
  // Slots are emptied in place on removal and compacted afterwards
  std::vector<std::optional<MinimizedEntry>> registry;

  OverflowMode mode = OverflowMode::Strip;
  float area_width = 0.0f;
  std::optional<float> item_outer_width; // Cached from the first rendered strip item
  std::optional<size_t> item_capacity;   // Unknown until an item has been measured

  // Extra entries tolerated in Strip mode when the area is resized
  size_t resize_tolerance = kDefaultResizeTolerance;

  std::vector<ItemView> strip_items;
  std::vector<ItemView> dropdown_items;
  bool dropdown_open = false;

  MeasureItemFn measure_item;

  // Append an entry, drop it again if it repeats the previous entry's pane,
  // then pick the presentation for the new size.
  EnqueueResult enqueue(const std::string& pane_id, const std::string& title);

  // Remove the entry shown under `index` and return it.
  // Throws std::out_of_range for an unknown or already emptied slot.
  MinimizedEntry restore(size_t index);

  // Remove the entry of a pane being closed. Returns false if it has none.
  bool release(const std::string& pane_id);

  // Recompute capacity for a new area width and switch modes if needed.
  void on_area_resized(float width);

  // Flip the dropdown list open/closed. Returns false outside Dropdown mode.
  bool toggle_dropdown();

  [[nodiscard]] size_t live_count() const;
  [[nodiscard]] std::optional<size_t> find_index(const std::string& pane_id) const;

  // Highest occupied slot (the most recently minimized pane still present).
  [[nodiscard]] std::optional<size_t> newest_index() const;

  // Representations the host should currently render.
  [[nodiscard]] const std::vector<ItemView>& visible_items() const;
};

} // namespace panewm::overflow
