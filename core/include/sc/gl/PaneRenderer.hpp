#pragma once
#include "sc/gl/ShaderProgram.hpp"

#include <glad/gl.h>

namespace sc {

class PaneScene;

struct PaneRendererStats {
  int drawCalls{0};
  int triangles{0};
  int lineSegments{0};
};

// Draws a PaneScene in pixel space with two programs: flat triangles and
// anti-aliased (optionally dashed) line quads. GL objects belong to the
// context that was current at init().
class PaneRenderer {
public:
  PaneRenderer() = default;
  ~PaneRenderer();

  PaneRenderer(const PaneRenderer&) = delete;
  PaneRenderer& operator=(const PaneRenderer&) = delete;

  bool init();
  void release();

  // Clears to the scene background and draws every batch in order.
  PaneRendererStats render(const PaneScene& scene, int viewW, int viewH);

private:
  ShaderProgram solidProg_;
  ShaderProgram lineProg_;
  GLuint vao_{0};
  GLuint vbo_{0};
  bool ready_{false};
};

} // namespace sc
