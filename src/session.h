#pragma once

#include <optional>
#include <string>

#include "geometry.h"

namespace panewm::session {

enum class SessionMode { Move, Resize };

enum class PointerButton { Primary, Secondary, Middle };

// Pointer payload delivered by the host with every pointer callback
struct PointerEvent {
  geom::Point position;
  PointerButton button = PointerButton::Primary;
};

// Transient state of an in-progress move or resize
struct DragSession {
  std::string target_pane_id;
  SessionMode mode = SessionMode::Move;
  std::optional<geom::ResizeZone> anchor_zone; // Set only for Resize
  geom::Point last_pointer;
};

// Result of one pointer-move step
struct StepResult {
  std::string pane_id;
  geom::Rect rect; // Rect to commit to the pane
};

// Tracks at most one drag/resize session.
struct SessionController {
  std::optional<DragSession> active;

  [[nodiscard]] bool is_active() const {
    return active.has_value();
  }

  [[nodiscard]] bool targets(const std::string& pane_id) const {
    return active.has_value() && active->target_pane_id == pane_id;
  }

  // Start a session. Fails if a session is already active, if the button is not
  // the primary one, or if a Resize session has no anchor zone.
  [[nodiscard]] bool begin(const std::string& pane_id, SessionMode mode,
                           std::optional<geom::ResizeZone> zone, const PointerEvent& event);

  // Compute the pane rect for a pointer move. `rect` is the pane's current rect,
  // `frame_margin` its resize container margin. Returns nullopt when idle.
  [[nodiscard]] std::optional<StepResult> step(const PointerEvent& event, const geom::Rect& rect,
                                               const geom::Viewport& viewport,
                                               float frame_margin);

  // End the session (from any pointer location). Returns false if none was active.
  bool end();
};

} // namespace panewm::session
