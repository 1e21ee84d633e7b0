#pragma once
#include "sc/sync/InputState.hpp"

namespace sc {

class PaneSynchronizer;

// Turns pointer drag / wheel / key input on any registered pane into
// shared range changes. Only consulted when no drawing mode intercepts.
class InputMapper {
public:
  explicit InputMapper(PaneSynchronizer& sync);

  void setConfig(const InputMapperConfig& cfg) { config_ = cfg; }
  const InputMapperConfig& config() const { return config_; }

  // Returns true if the shared range changed.
  bool processInput(const PaneInputState& input);

  // Pane the last input was routed to, or 0.
  Id activePaneId() const { return active_; }

private:
  bool applyDrag(const PaneInputState& input);
  bool applyZoom(const PaneInputState& input);

  PaneSynchronizer& sync_;
  InputMapperConfig config_;
  Id active_{0};
};

} // namespace sc
