#pragma once
#include "sc/ids/Id.hpp"

#include <cstdint>

namespace sc {

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, Up, Down, Home, End,
  Plus,   // '+' or '='
  Minus,  // '-'
  Reset   // 'r' / 'R'
};

// Generic per-frame input snapshot for one pane, host-toolkit agnostic.
struct PaneInputState {
  Id paneId{0};                   // pane under the pointer
  double cursorX{0}, cursorY{0};  // pane-local pixels, 0=left/top
  double dragDx{0}, dragDy{0};    // pixel deltas this frame
  double scrollDelta{0};          // positive = zoom in
  bool dragging{false};
  KeyCode keyPressed{KeyCode::None};
};

struct InputMapperConfig {
  double zoomSensitivity{0.1};
  double minVisibleBars{5.0};   // wheel zoom-in stops at this width
};

} // namespace sc
