#include "session.h"

#include <spdlog/spdlog.h>

#include <magic_enum/magic_enum.hpp>

namespace panewm::session {

bool SessionController::begin(const std::string& pane_id, SessionMode mode,
                              std::optional<geom::ResizeZone> zone, const PointerEvent& event) {
  if (event.button != PointerButton::Primary) {
    spdlog::trace("session: ignoring {} button on '{}'", magic_enum::enum_name(event.button),
                  pane_id);
    return false;
  }
  if (active.has_value()) {
    spdlog::warn("session: '{}' requested while '{}' is active", pane_id,
                 active->target_pane_id);
    return false;
  }
  if (mode == SessionMode::Resize && !zone.has_value()) {
    spdlog::warn("session: resize on '{}' without an anchor zone", pane_id);
    return false;
  }

  active = DragSession{pane_id, mode, mode == SessionMode::Resize ? zone : std::nullopt,
                       event.position};
  if (active->anchor_zone.has_value()) {
    spdlog::debug("session: {} '{}' from {} at ({}, {})", magic_enum::enum_name(mode), pane_id,
                  magic_enum::enum_name(*active->anchor_zone), event.position.x,
                  event.position.y);
  } else {
    spdlog::debug("session: {} '{}' at ({}, {})", magic_enum::enum_name(mode), pane_id,
                  event.position.x, event.position.y);
  }
  return true;
}

std::optional<StepResult> SessionController::step(const PointerEvent& event,
                                                  const geom::Rect& rect,
                                                  const geom::Viewport& viewport,
                                                  float frame_margin) {
  if (!active.has_value()) {
    return std::nullopt;
  }

  // Incremental delta since the previous move, pointing against the drag direction
  geom::Point delta{active->last_pointer.x - event.position.x,
                    active->last_pointer.y - event.position.y};

  StepResult result{active->target_pane_id, rect};
  switch (active->mode) {
  case SessionMode::Move:
    result.rect = geom::compute_moved_rect(rect, delta, viewport, frame_margin);
    break;
  case SessionMode::Resize:
    result.rect = geom::compute_resized_rect(rect, delta, *active->anchor_zone, viewport);
    break;
  }

  active->last_pointer = event.position;
  return result;
}

bool SessionController::end() {
  if (!active.has_value()) {
    return false;
  }
  spdlog::debug("session: {} '{}' ended", magic_enum::enum_name(active->mode),
                active->target_pane_id);
  active.reset();
  return true;
}

} // namespace panewm::session
