#include "sc/capture/FrameLoop.hpp"

#include <cstdio>

namespace sc {

void FrameLoop::afterNextRender(Task task) {
  if (task) pending_.push_back(std::move(task));
}

void FrameLoop::tick() {
  if (inTick_) {
    std::fprintf(stderr, "FrameLoop: nested tick ignored\n");
    return;
  }
  inTick_ = true;

  // Only continuations queued before this render run after it.
  std::vector<Task> ready;
  ready.swap(pending_);

  if (render_) render_();
  frames_++;

  for (auto& task : ready) {
    task();
  }
  inTick_ = false;
}

} // namespace sc
