#pragma once
#include <cstdint>
#include <functional>
#include <vector>

namespace sc {

// Cooperative render tick. tick() runs the render callback, then the
// continuations that were queued before the tick started; continuations
// queued while a tick runs wait for the next one.
class FrameLoop {
public:
  using RenderCallback = std::function<void()>;
  using Task = std::function<void()>;

  void setRenderCallback(RenderCallback cb) { render_ = std::move(cb); }

  // One-shot continuation after the next completed render.
  void afterNextRender(Task task);

  void tick();

  std::uint64_t frameCount() const { return frames_; }
  std::size_t pendingCount() const { return pending_.size(); }
  bool inTick() const { return inTick_; }

private:
  RenderCallback render_;
  std::vector<Task> pending_;
  std::uint64_t frames_{0};
  bool inTick_{false};
};

} // namespace sc
