#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "manager.h"

using namespace panewm;

namespace {

// Records every host callback the manager invokes
struct HostRecorder {
  std::map<std::string, std::vector<AffordanceRole>> affordances;
  std::map<std::string, bool> visibility;
  std::vector<std::string> detached;
};

WindowManager create_manager(HostRecorder& recorder, float width = 1000.0f,
                             float height = 800.0f, MinimizeOptions minimize = {}) {
  HostCallbacks host;
  host.attach_affordance = [&recorder](const std::string& id, AffordanceRole role,
                                       std::optional<geom::ResizeZone>) {
    recorder.affordances[id].push_back(role);
  };
  host.set_pane_visible = [&recorder](const std::string& id, bool visible) {
    recorder.visibility[id] = visible;
  };
  host.detach_pane = [&recorder](const std::string& id) { recorder.detached.push_back(id); };

  WindowManager manager;
  manager.init(geom::Viewport{width, height}, std::move(host), minimize);
  return manager;
}

PaneConfig config_at(float x, float y, float w, float h) {
  PaneConfig config;
  config.initial_rect = geom::Rect{x, y, w, h};
  return config;
}

session::PointerEvent at(float x, float y) {
  return session::PointerEvent{geom::Point{x, y}};
}

size_t count(const std::vector<AffordanceRole>& roles, AffordanceRole role) {
  size_t n = 0;
  for (auto r : roles) {
    if (r == role) {
      ++n;
    }
  }
  return n;
}

} // namespace

TEST_SUITE("WindowManager registration") {
  TEST_CASE("default rect is 200x150 at the origin") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    Pane& pane = manager.register_pane("a", PaneConfig{});

    CHECK(pane.rect == geom::Rect{0.0f, 0.0f, 200.0f, 150.0f});
    CHECK(pane.title == "a");
    CHECK(pane.state == PaneState::Normal);
    CHECK(pane.visible);
    CHECK(pane.z_tier == ZTier::Back);
  }

  TEST_CASE("zero size falls back to the default size") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    Pane& pane = manager.register_pane("a", config_at(10.0f, 20.0f, 0.0f, 0.0f));
    CHECK(pane.rect == geom::Rect{10.0f, 20.0f, 200.0f, 150.0f});
  }

  TEST_CASE("initial rect is contained in the viewport") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    Pane& pane = manager.register_pane("a", config_at(900.0f, 0.0f, 300.0f, 100.0f));
    CHECK(pane.rect == geom::Rect{900.0f, 0.0f, 94.0f, 100.0f});
    CHECK(manager.validate());
  }

  TEST_CASE("affordances follow capabilities and triggers") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("full", PaneConfig{});

    PaneConfig fixed;
    fixed.capabilities.resizable = false;
    fixed.capabilities.closable = false;
    fixed.triggers.min_max_icons = false;
    manager.register_pane("fixed", fixed);

    const auto& full = recorder.affordances["full"];
    CHECK(count(full, AffordanceRole::DragHandle) == 1);
    CHECK(count(full, AffordanceRole::ResizeHandle) == 8);
    CHECK(count(full, AffordanceRole::MinimizeButton) == 1);
    CHECK(count(full, AffordanceRole::MaximizeButton) == 1);
    CHECK(count(full, AffordanceRole::CloseButton) == 1);

    const auto& limited = recorder.affordances["fixed"];
    CHECK(limited.size() == 1);
    CHECK(count(limited, AffordanceRole::DragHandle) == 1);
  }

  TEST_CASE("empty and duplicate ids are rejected") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    CHECK_THROWS_AS(manager.register_pane("", PaneConfig{}), std::runtime_error);
    CHECK_THROWS_AS(manager.register_pane("a", PaneConfig{}), std::runtime_error);
    CHECK(manager.panes.size() == 1);
  }

  TEST_CASE("unknown ids fail loud") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    CHECK(manager.find_pane("missing") == nullptr);
    CHECK_THROWS_AS((void)manager.pane("missing"), std::runtime_error);
    CHECK_THROWS_AS((void)manager.on_pointer_down("missing", HitArea::Body, std::nullopt,
                                                  at(0.0f, 0.0f)),
                    std::runtime_error);
    CHECK_THROWS_AS((void)manager.on_minimize_requested("missing", MinimizeSource::Icon),
                    std::runtime_error);
    CHECK_THROWS_AS((void)manager.on_close_requested("missing"), std::runtime_error);
    CHECK_THROWS_AS((void)manager.on_restore_requested(0), std::out_of_range);
  }
}

TEST_SUITE("WindowManager pointer sessions") {
  TEST_CASE("pointer down brings the pane to front") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    PaneConfig fixed;
    fixed.capabilities.resizable = false;
    manager.register_pane("b", fixed);

    CHECK_FALSE(manager.on_pointer_down("b", HitArea::Body, std::nullopt, at(10.0f, 10.0f)));
    CHECK(manager.pane("b").z_tier == ZTier::Front);
    CHECK(manager.pane("a").z_tier == ZTier::Back);
    CHECK(manager.focused_pane() == &manager.pane("b"));

    CHECK_FALSE(manager.on_pointer_down("a", HitArea::Body, std::nullopt, at(10.0f, 10.0f)));
    CHECK(manager.pane("a").z_tier == ZTier::Front);
    CHECK(manager.pane("b").z_tier == ZTier::Inherit);
  }

  TEST_CASE("pointer down on a minimized pane keeps the focus") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", PaneConfig{});
    CHECK(manager.on_minimize_requested("b", MinimizeSource::Icon));
    CHECK_FALSE(manager.on_pointer_down("a", HitArea::Body, std::nullopt, at(10.0f, 10.0f)));

    CHECK_FALSE(manager.on_pointer_down("b", HitArea::DragHandle, std::nullopt, at(10.0f, 10.0f)));
    CHECK(manager.pane("b").z_tier == ZTier::Back);
    CHECK(manager.pane("a").z_tier == ZTier::Front);
    CHECK(manager.focused_pane() == &manager.pane("a"));
    CHECK(manager.validate());
  }

  TEST_CASE("drag handle moves the pane incrementally") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(100.0f, 100.0f, 200.0f, 150.0f));

    CHECK(manager.on_pointer_down("a", HitArea::DragHandle, std::nullopt, at(150.0f, 105.0f)));
    CHECK(manager.on_pointer_move(at(170.0f, 115.0f)));
    CHECK(manager.on_pointer_move(at(180.0f, 115.0f)));
    CHECK(manager.pane("a").rect == geom::Rect{130.0f, 110.0f, 200.0f, 150.0f});

    CHECK(manager.on_pointer_up(at(500.0f, 500.0f)));
    CHECK_FALSE(manager.sessions.is_active());
    CHECK_FALSE(manager.on_pointer_move(at(600.0f, 600.0f)));
    CHECK(manager.pane("a").rect == geom::Rect{130.0f, 110.0f, 200.0f, 150.0f});
  }

  TEST_CASE("resize handle resizes from its zone") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(100.0f, 100.0f, 200.0f, 150.0f));

    CHECK(manager.on_pointer_down("a", HitArea::ResizeHandle, geom::ResizeZone::Left,
                                  at(100.0f, 150.0f)));
    CHECK(manager.on_pointer_move(at(90.0f, 150.0f)));
    CHECK(manager.pane("a").rect == geom::Rect{90.0f, 100.0f, 210.0f, 150.0f});
    CHECK(manager.on_pointer_up(at(90.0f, 150.0f)));
  }

  TEST_CASE("capabilities gate sessions") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    PaneConfig pinned;
    pinned.capabilities.draggable = false;
    pinned.capabilities.resizable = false;
    manager.register_pane("a", pinned);

    CHECK_FALSE(
        manager.on_pointer_down("a", HitArea::DragHandle, std::nullopt, at(10.0f, 10.0f)));
    CHECK_FALSE(manager.on_pointer_down("a", HitArea::ResizeHandle, geom::ResizeZone::Right,
                                        at(10.0f, 10.0f)));
    CHECK_FALSE(manager.sessions.is_active());
    CHECK(manager.pane("a").z_tier == ZTier::Front);
  }

  TEST_CASE("only one session at a time") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", config_at(300.0f, 300.0f, 100.0f, 100.0f));

    CHECK(manager.on_pointer_down("a", HitArea::DragHandle, std::nullopt, at(10.0f, 10.0f)));
    CHECK_FALSE(
        manager.on_pointer_down("b", HitArea::DragHandle, std::nullopt, at(310.0f, 310.0f)));
    CHECK(manager.sessions.targets("a"));
  }

  TEST_CASE("panes stay contained through arbitrary move and resize sequences") {
    HostRecorder recorder;
    auto manager = create_manager(recorder, 640.0f, 480.0f);
    manager.register_pane("a", config_at(50.0f, 50.0f, 200.0f, 150.0f));
    PaneConfig fixed = config_at(300.0f, 200.0f, 120.0f, 90.0f);
    fixed.capabilities.resizable = false;
    manager.register_pane("b", fixed);

    const auto zones = std::vector<geom::ResizeZone>{
        geom::ResizeZone::Left,      geom::ResizeZone::Right,      geom::ResizeZone::Top,
        geom::ResizeZone::Bottom,    geom::ResizeZone::UpperLeft,  geom::ResizeZone::UpperRight,
        geom::ResizeZone::LowerLeft, geom::ResizeZone::LowerRight,
    };

    // Deterministic linear congruential sequence
    uint32_t seed = 12345;
    auto next = [&seed](uint32_t bound) {
      seed = seed * 1664525u + 1013904223u;
      return (seed >> 8) % bound;
    };

    for (int round = 0; round < 200; ++round) {
      std::string id = next(2) == 0 ? "a" : "b";
      const Pane& p = manager.pane(id);
      float px = p.rect.x + 1.0f;
      float py = p.rect.y + 1.0f;

      bool resize = id == "a" && next(2) == 0;
      bool started =
          resize ? manager.on_pointer_down(id, HitArea::ResizeHandle, zones[next(8)], at(px, py))
                 : manager.on_pointer_down(id, HitArea::DragHandle, std::nullopt, at(px, py));
      REQUIRE(started);

      for (int step = 0; step < 10; ++step) {
        px += static_cast<float>(next(241)) - 120.0f;
        py += static_cast<float>(next(241)) - 120.0f;
        manager.on_pointer_move(at(px, py));

        for (const auto& pane : manager.panes) {
          CHECK(geom::is_contained(pane_frame(pane), manager.viewport));
          CHECK(pane.rect.width >= geom::kMinPaneWidth);
          CHECK(pane.rect.height >= geom::kMinPaneHeight);
        }
      }
      CHECK(manager.on_pointer_up(at(px, py)));
    }
    CHECK(manager.validate());
  }
}

TEST_SUITE("WindowManager lifecycle") {
  TEST_CASE("minimize hides the pane and lists it") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(10.0f, 10.0f, 100.0f, 100.0f));

    CHECK(manager.on_minimize_requested("a", MinimizeSource::Icon));
    CHECK(manager.pane("a").state == PaneState::Minimized);
    CHECK(recorder.visibility["a"] == false);
    CHECK(manager.minimized.find_index("a") == std::optional<size_t>(0));
    CHECK(manager.pane("a").rect == geom::Rect{10.0f, 10.0f, 100.0f, 100.0f});
    CHECK(manager.validate());
  }

  TEST_CASE("a repeated minimize does not add a second entry") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});

    CHECK(manager.on_minimize_requested("a", MinimizeSource::DoubleClick));
    CHECK_FALSE(manager.on_minimize_requested("a", MinimizeSource::Icon));
    CHECK(manager.minimized.live_count() == 1);
  }

  TEST_CASE("disabled triggers reject the request") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    PaneConfig config;
    config.triggers.minimize_on_double_click = false;
    manager.register_pane("a", config);

    CHECK_FALSE(manager.on_minimize_requested("a", MinimizeSource::DoubleClick));
    CHECK(manager.pane("a").state == PaneState::Normal);
    CHECK(manager.on_minimize_requested("a", MinimizeSource::Icon));
  }

  TEST_CASE("restore brings a minimized pane back") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", PaneConfig{});
    CHECK(manager.on_minimize_requested("a", MinimizeSource::Icon));
    CHECK(manager.on_minimize_requested("b", MinimizeSource::Icon));

    CHECK(manager.on_restore_requested(0));
    CHECK(manager.pane("a").state == PaneState::Normal);
    CHECK(recorder.visibility["a"] == true);
    CHECK(manager.minimized.find_index("b") == std::optional<size_t>(0));
    CHECK_THROWS_AS((void)manager.on_restore_requested(1), std::out_of_range);
    CHECK(manager.validate());
  }

  TEST_CASE("maximize toggles with an exact round trip") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(33.0f, 44.0f, 210.0f, 120.0f));

    CHECK(manager.on_maximize_requested("a"));
    CHECK(manager.pane("a").rect == geom::Rect{0.0f, 0.0f, 994.0f, 794.0f});
    CHECK(manager.validate());

    CHECK(manager.on_maximize_requested("a"));
    CHECK(manager.pane("a").rect == geom::Rect{33.0f, 44.0f, 210.0f, 120.0f});
    CHECK(manager.pane("a").state == PaneState::Normal);
  }

  TEST_CASE("minimize of a maximized pane and maximize of a minimized pane are rejected") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", PaneConfig{});

    CHECK(manager.on_maximize_requested("a"));
    CHECK_FALSE(manager.on_minimize_requested("a", MinimizeSource::Icon));
    CHECK(manager.pane("a").state == PaneState::Maximized);
    CHECK(manager.minimized.live_count() == 0);

    CHECK(manager.on_minimize_requested("b", MinimizeSource::Icon));
    CHECK_FALSE(manager.on_maximize_requested("b"));
    CHECK(manager.pane("b").state == PaneState::Minimized);
    CHECK(manager.validate());
  }

  TEST_CASE("close removes the pane and detaches it") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", PaneConfig{});

    CHECK(manager.on_close_requested("a"));
    CHECK(manager.find_pane("a") == nullptr);
    CHECK(recorder.detached == std::vector<std::string>{"a"});
    CHECK(manager.panes.size() == 1);
  }

  TEST_CASE("close requires the capability") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    PaneConfig config;
    config.capabilities.closable = false;
    manager.register_pane("a", config);

    CHECK_FALSE(manager.on_close_requested("a"));
    CHECK(manager.find_pane("a") != nullptr);
    CHECK(recorder.detached.empty());
  }

  TEST_CASE("closing the target of an active session is rejected") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", config_at(300.0f, 300.0f, 100.0f, 100.0f));

    CHECK(manager.on_pointer_down("a", HitArea::DragHandle, std::nullopt, at(5.0f, 5.0f)));
    CHECK_FALSE(manager.on_close_requested("a"));
    CHECK(manager.on_close_requested("b"));
    CHECK(manager.on_pointer_up(at(5.0f, 5.0f)));
    CHECK(manager.on_close_requested("a"));
  }

  TEST_CASE("closing a minimized pane releases its entry") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    for (const char* id : {"a", "b", "c"}) {
      manager.register_pane(id, PaneConfig{});
      CHECK(manager.on_minimize_requested(id, MinimizeSource::Icon));
    }

    CHECK(manager.on_close_requested("a"));
    CHECK(manager.minimized.live_count() == 2);
    CHECK(manager.minimized.find_index("b") == std::optional<size_t>(0));
    CHECK(manager.minimized.find_index("c") == std::optional<size_t>(1));
    CHECK(manager.validate());
  }

  TEST_CASE("closing a maximized pane drops its saved rect") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    CHECK(manager.on_maximize_requested("a"));
    CHECK(manager.on_close_requested("a"));
    CHECK(manager.panes.empty());
    CHECK(manager.validate());
  }
}

TEST_SUITE("WindowManager resize fan-out") {
  TEST_CASE("viewport shrink contains every pane") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(600.0f, 400.0f, 300.0f, 300.0f));
    PaneConfig fixed = config_at(700.0f, 100.0f, 250.0f, 100.0f);
    fixed.capabilities.resizable = false;
    manager.register_pane("b", fixed);
    manager.register_pane("c", config_at(10.0f, 10.0f, 100.0f, 100.0f));
    CHECK(manager.on_maximize_requested("c"));

    manager.on_viewport_resized(800.0f, 600.0f);

    CHECK(manager.pane("a").rect == geom::Rect{600.0f, 400.0f, 194.0f, 194.0f});
    CHECK(manager.pane("b").rect == geom::Rect{700.0f, 100.0f, 100.0f, 100.0f});
    CHECK(manager.pane("c").rect == geom::Rect{0.0f, 0.0f, 794.0f, 594.0f});
    CHECK(manager.validate());

    CHECK(manager.on_maximize_requested("c"));
    CHECK(manager.pane("c").rect == geom::Rect{10.0f, 10.0f, 100.0f, 100.0f});
  }

  TEST_CASE("viewport below the size floor shifts panes inside") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(500.0f, 500.0f, 200.0f, 150.0f));

    manager.on_viewport_resized(300.0f, 200.0f);
    const Pane& a = manager.pane("a");
    CHECK(a.rect.width == geom::kMinPaneWidth);
    CHECK(a.rect.height == geom::kMinPaneHeight);
    CHECK(geom::is_contained(pane_frame(a), manager.viewport));
  }

  TEST_CASE("minimized panes follow the capacity scenario") {
    HostRecorder recorder;
    MinimizeOptions minimize;
    minimize.itemMetrics = overflow::ItemMetrics{92.0f, 4.0f, 4.0f};
    auto manager = create_manager(recorder, 300.0f, 800.0f, minimize);

    for (const char* id : {"a", "b", "c", "d"}) {
      manager.register_pane(id, PaneConfig{});
      CHECK(manager.on_minimize_requested(id, MinimizeSource::Icon));
    }
    CHECK(manager.minimized.mode == overflow::OverflowMode::Dropdown);

    CHECK(manager.on_restore_requested(3));
    CHECK(manager.minimized.mode == overflow::OverflowMode::Strip);
    std::vector<size_t> ids;
    for (const auto& view : manager.minimized.strip_items) {
      ids.push_back(view.index);
    }
    CHECK(ids == std::vector<size_t>{0, 1, 2});
    CHECK(manager.validate());
  }

  TEST_CASE("viewport resize re-lays out the minimize area") {
    HostRecorder recorder;
    MinimizeOptions minimize;
    minimize.itemMetrics = overflow::ItemMetrics{92.0f, 4.0f, 4.0f};
    auto manager = create_manager(recorder, 400.0f, 800.0f, minimize);
    for (const char* id : {"a", "b", "c", "d"}) {
      manager.register_pane(id, PaneConfig{});
      CHECK(manager.on_minimize_requested(id, MinimizeSource::Icon));
    }
    CHECK(manager.minimized.mode == overflow::OverflowMode::Strip);

    manager.on_viewport_resized(200.0f, 800.0f);
    CHECK(manager.minimized.mode == overflow::OverflowMode::Dropdown);

    manager.on_minimize_area_resized(400.0f);
    CHECK(manager.minimized.mode == overflow::OverflowMode::Strip);
  }
}

TEST_SUITE("WindowManager actions") {
  TEST_CASE("actions apply to the focused pane") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", config_at(300.0f, 300.0f, 100.0f, 100.0f));

    CHECK_FALSE(manager.process_action(PaneAction::MinimizeFocused).success);

    CHECK_FALSE(manager.on_pointer_down("b", HitArea::Body, std::nullopt, at(310.0f, 310.0f)));
    auto result = manager.process_action(PaneAction::ToggleMaximizeFocused);
    CHECK(result.success);
    CHECK(result.pane_id == std::optional<std::string>("b"));
    CHECK(manager.pane("b").state == PaneState::Maximized);

    CHECK(manager.process_action(PaneAction::ToggleMaximizeFocused).success);
    CHECK(manager.process_action(PaneAction::MinimizeFocused).success);
    CHECK(manager.pane("b").state == PaneState::Minimized);
    CHECK(manager.focused_pane() == nullptr);

    result = manager.process_action(PaneAction::RestoreNewest);
    CHECK(result.success);
    CHECK(result.pane_id == std::optional<std::string>("b"));
    CHECK(manager.pane("b").state == PaneState::Normal);
    CHECK_FALSE(manager.process_action(PaneAction::RestoreNewest).success);

    CHECK(manager.process_action(PaneAction::CloseFocused).success);
    CHECK(manager.find_pane("b") == nullptr);
  }

  TEST_CASE("dropdown toggle, debug print and validate") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});

    CHECK_FALSE(manager.process_action(PaneAction::ToggleDropdown).success);
    CHECK(manager.process_action(PaneAction::DebugPrint).success);
    CHECK(manager.process_action(PaneAction::Validate).success);
  }

  TEST_CASE("validate reports inconsistent state") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", PaneConfig{});
    manager.register_pane("b", PaneConfig{});
    CHECK(manager.validate());

    manager.pane("a").z_tier = ZTier::Front;
    manager.pane("b").z_tier = ZTier::Front;
    CHECK_FALSE(manager.validate());
  }

  TEST_CASE("pane_at_point returns the top-most visible pane") {
    HostRecorder recorder;
    auto manager = create_manager(recorder);
    manager.register_pane("a", config_at(0.0f, 0.0f, 100.0f, 100.0f));
    manager.register_pane("b", config_at(50.0f, 50.0f, 100.0f, 100.0f));

    CHECK(manager.pane_at_point(geom::Point{60.0f, 60.0f}) == &manager.pane("b"));
    CHECK_FALSE(manager.on_pointer_down("a", HitArea::Body, std::nullopt, at(10.0f, 10.0f)));
    CHECK(manager.pane_at_point(geom::Point{60.0f, 60.0f}) == &manager.pane("a"));

    CHECK(manager.on_minimize_requested("a", MinimizeSource::Icon));
    CHECK(manager.pane_at_point(geom::Point{60.0f, 60.0f}) == &manager.pane("b"));
    CHECK(manager.pane_at_point(geom::Point{900.0f, 700.0f}) == nullptr);
  }
}

#endif // DOCTEST_CONFIG_DISABLE
