#include "geometry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

namespace panewm::geom {

// ============================================================================
// Zone Decomposition
// ============================================================================

HorizontalEdge horizontal_edge(ResizeZone zone) {
  switch (zone) {
  case ResizeZone::Left:
  case ResizeZone::UpperLeft:
  case ResizeZone::LowerLeft:
    return HorizontalEdge::Left;
  case ResizeZone::Right:
  case ResizeZone::UpperRight:
  case ResizeZone::LowerRight:
    return HorizontalEdge::Right;
  case ResizeZone::Top:
  case ResizeZone::Bottom:
    return HorizontalEdge::None;
  }
  return HorizontalEdge::None;
}

VerticalEdge vertical_edge(ResizeZone zone) {
  switch (zone) {
  case ResizeZone::Top:
  case ResizeZone::UpperLeft:
  case ResizeZone::UpperRight:
    return VerticalEdge::Top;
  case ResizeZone::Bottom:
  case ResizeZone::LowerLeft:
  case ResizeZone::LowerRight:
    return VerticalEdge::Bottom;
  case ResizeZone::Left:
  case ResizeZone::Right:
    return VerticalEdge::None;
  }
  return VerticalEdge::None;
}

// ============================================================================
// Queries
// ============================================================================

Rect frame_rect(const Rect& rect, float frame_margin) {
  return {rect.x, rect.y, rect.width + frame_margin, rect.height + frame_margin};
}

bool contains_point(const Rect& rect, Point p) {
  return p.x >= rect.x && p.x < rect.x + rect.width && p.y >= rect.y &&
         p.y < rect.y + rect.height;
}

bool is_contained(const Rect& rect, const Viewport& viewport) {
  return rect.x >= 0.0f && rect.y >= 0.0f && rect.x + rect.width <= viewport.width &&
         rect.y + rect.height <= viewport.height;
}

bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

bool operator!=(const Rect& a, const Rect& b) {
  return !(a == b);
}

// ============================================================================
// Internal Helpers
// ============================================================================

namespace {

// One axis of a resize step. `start`/`length` are the pane offset and size on
// that axis, `limit` the viewport extent. `near_edge` is true for Left/Top.
struct AxisResize {
  float start;
  float length;
};

std::optional<AxisResize> resize_axis(float start, float length, float delta, bool near_edge,
                                      float limit, float min_length) {
  // Far edges grow when the pointer moves away from the pane origin
  float drag = near_edge ? delta : -delta;
  float new_length = length + drag;

  if (!near_edge && start + new_length + kEdgeMargin > limit) {
    return std::nullopt;
  }
  if (new_length < min_length) {
    return std::nullopt;
  }

  float new_start = start;
  if (near_edge) {
    new_start = start - drag;
    if (new_start < 0.0f) {
      return std::nullopt;
    }
  }
  return AxisResize{new_start, new_length};
}

} // namespace

// ============================================================================
// Rect Computation
// ============================================================================

Rect compute_moved_rect(const Rect& rect, Point delta, const Viewport& viewport,
                        float frame_margin) {
  Rect moved = rect;
  moved.x = rect.x - delta.x;
  moved.y = rect.y - delta.y;

  float right = moved.x + rect.width + frame_margin;
  float bottom = moved.y + rect.height + frame_margin;

  if (moved.x < 0.0f || right > viewport.width) {
    spdlog::trace("move: horizontal step rejected (x={}, right={}, limit={})", moved.x, right,
                  viewport.width);
    moved.x = rect.x;
  }
  if (moved.y < 0.0f || bottom > viewport.height) {
    spdlog::trace("move: vertical step rejected (y={}, bottom={}, limit={})", moved.y, bottom,
                  viewport.height);
    moved.y = rect.y;
  }
  return moved;
}

Rect compute_resized_rect(const Rect& rect, Point delta, ResizeZone zone,
                          const Viewport& viewport) {
  Rect resized = rect;

  HorizontalEdge h = horizontal_edge(zone);
  if (h != HorizontalEdge::None) {
    auto axis = resize_axis(rect.x, rect.width, delta.x, h == HorizontalEdge::Left,
                            viewport.width, kMinPaneWidth);
    if (axis.has_value()) {
      resized.x = axis->start;
      resized.width = axis->length;
    } else {
      spdlog::trace("resize {}: horizontal step rejected", magic_enum::enum_name(zone));
    }
  }

  VerticalEdge v = vertical_edge(zone);
  if (v != VerticalEdge::None) {
    auto axis = resize_axis(rect.y, rect.height, delta.y, v == VerticalEdge::Top,
                            viewport.height, kMinPaneHeight);
    if (axis.has_value()) {
      resized.y = axis->start;
      resized.height = axis->length;
    } else {
      spdlog::trace("resize {}: vertical step rejected", magic_enum::enum_name(zone));
    }
  }

  return resized;
}

Rect contain_in_viewport(const Rect& rect, const Viewport& viewport, float frame_margin) {
  Rect contained = rect;

  if (contained.x + contained.width + frame_margin > viewport.width) {
    float width = viewport.width - contained.x - frame_margin;
    if (width >= kMinPaneWidth) {
      contained.width = width;
    } else {
      contained.width = kMinPaneWidth;
      contained.x = std::max(0.0f, viewport.width - kMinPaneWidth - frame_margin);
    }
  }

  if (contained.y + contained.height + frame_margin > viewport.height) {
    float height = viewport.height - contained.y - frame_margin;
    if (height >= kMinPaneHeight) {
      contained.height = height;
    } else {
      contained.height = kMinPaneHeight;
      contained.y = std::max(0.0f, viewport.height - kMinPaneHeight - frame_margin);
    }
  }

  return contained;
}

} // namespace panewm::geom
