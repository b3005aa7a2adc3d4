#pragma once

#include <optional>

namespace panewm::geom {

// Basic geometric types (pixels, viewport coordinates)
struct Point {
  float x = 0.0f;
  float y = 0.0f;
};

struct Rect {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;
};

// Containment bounds reported by the host surface
struct Viewport {
  float width = 0.0f;
  float height = 0.0f;
};

// The eight resize handle positions around a pane
enum class ResizeZone {
  Left,
  Right,
  Top,
  Bottom,
  UpperLeft,
  UpperRight,
  LowerLeft,
  LowerRight,
};

enum class HorizontalEdge { None, Left, Right };
enum class VerticalEdge { None, Top, Bottom };

constexpr float kMinPaneWidth = 5.0f;
constexpr float kMinPaneHeight = 5.0f;
constexpr float kDefaultPaneWidth = 200.0f;
constexpr float kDefaultPaneHeight = 150.0f;

// Thickness of a single resize handle; handles sit on both sides of a resizable pane
constexpr float kResizeHandleThickness = 3.0f;
constexpr float kEdgeMargin = 2.0f * kResizeHandleThickness;

// ============================================================================
// Zone Decomposition
// ============================================================================

[[nodiscard]] HorizontalEdge horizontal_edge(ResizeZone zone);
[[nodiscard]] VerticalEdge vertical_edge(ResizeZone zone);

// ============================================================================
// Queries
// ============================================================================

// Rectangle occupied by a pane including the handle margin of its resize container.
[[nodiscard]] Rect frame_rect(const Rect& rect, float frame_margin);

[[nodiscard]] bool contains_point(const Rect& rect, Point p);

// True if the rect lies entirely inside the viewport.
[[nodiscard]] bool is_contained(const Rect& rect, const Viewport& viewport);

[[nodiscard]] bool operator==(const Rect& a, const Rect& b);
[[nodiscard]] bool operator!=(const Rect& a, const Rect& b);

// ============================================================================
// Rect Computation
// ============================================================================

// Move rect opposite to delta (delta = previous pointer - current pointer).
// An axis whose moved frame would cross a viewport edge keeps its previous
// coordinate; the offending step is discarded rather than clamped.
[[nodiscard]] Rect compute_moved_rect(const Rect& rect, Point delta, const Viewport& viewport,
                                      float frame_margin = 0.0f);

// Resize rect from the given anchor zone. Horizontal and vertical components
// are resolved independently; a component that would violate the minimum size
// or a viewport edge leaves that axis untouched for this step.
[[nodiscard]] Rect compute_resized_rect(const Rect& rect, Point delta, ResizeZone zone,
                                        const Viewport& viewport);

// Shrink (or, below the size floor, shift) rect so its frame fits the viewport.
// Used after the viewport changes size.
[[nodiscard]] Rect contain_in_viewport(const Rect& rect, const Viewport& viewport,
                                       float frame_margin);

} // namespace panewm::geom
