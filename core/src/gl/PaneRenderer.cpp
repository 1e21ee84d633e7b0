#include "sc/gl/PaneRenderer.hpp"
#include "sc/render/PaneScene.hpp"

#include <cstdio>

namespace sc {

// ---- solid shader (pixel-space triangles) ----

static const char* kSolidVert = R"GLSL(
#version 330 core
in vec2 a_pos;
uniform mat3 u_transform;
void main() {
    vec3 p = u_transform * vec3(a_pos, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
out vec4 outColor;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- line shader: one instanced quad per segment, expanded in pixels ----

static const char* kLineVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
uniform float u_lineWidth;
uniform float u_aaWidth;
out float v_dist;
out float v_along;
void main() {
    vec2 p0 = a_rect.xy;
    vec2 p1 = a_rect.zw;

    vec2 dir = p1 - p0;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);

    float hw = u_lineWidth * 0.5;
    float totalHW = hw + u_aaWidth;

    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, -1.0);
    else if (vid == 1) uv = vec2(1.0, -1.0);
    else if (vid == 2) uv = vec2(0.0,  1.0);
    else if (vid == 3) uv = vec2(0.0,  1.0);
    else if (vid == 4) uv = vec2(1.0, -1.0);
    else               uv = vec2(1.0,  1.0);

    vec2 pos = mix(p0, p1, uv.x) + perp * (uv.y * totalHW);
    vec3 c = u_transform * vec3(pos, 1.0);
    gl_Position = vec4(c.xy, 0.0, 1.0);
    // v_dist: 0 at center, 1.0 at nominal edge, >1.0 in AA fringe
    v_dist = uv.y * totalHW / max(hw, 0.0001);
    v_along = uv.x * len;
}
)GLSL";

static const char* kLineFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_fringeEdge;
uniform float u_dash;
uniform float u_gap;
in float v_dist;
in float v_along;
out vec4 outColor;
void main() {
    if (u_dash > 0.0 && mod(v_along, u_dash + u_gap) > u_dash) discard;
    float d = abs(v_dist);
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, d);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

PaneRenderer::~PaneRenderer() {
  release();
}

bool PaneRenderer::init() {
  if (ready_) return true;

  if (!solidProg_.build(kSolidVert, kSolidFrag)) {
    std::fprintf(stderr, "PaneRenderer::init: failed to build solid shader\n");
    return false;
  }
  if (!lineProg_.build(kLineVert, kLineFrag)) {
    std::fprintf(stderr, "PaneRenderer::init: failed to build line shader\n");
    solidProg_.release();
    return false;
  }

  glGenVertexArrays(1, &vao_);
  glGenBuffers(1, &vbo_);
  ready_ = true;
  return true;
}

void PaneRenderer::release() {
  if (!ready_) return;
  if (vbo_) glDeleteBuffers(1, &vbo_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
  vbo_ = 0;
  vao_ = 0;
  solidProg_.release();
  lineProg_.release();
  ready_ = false;
}

PaneRendererStats PaneRenderer::render(const PaneScene& scene, int viewW, int viewH) {
  PaneRendererStats stats;
  if (!ready_ || viewW <= 0 || viewH <= 0) return stats;

  glViewport(0, 0, viewW, viewH);
  const float* bg = scene.background();
  glClearColor(bg[0], bg[1], bg[2], bg[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  // Pixel space (origin top-left) -> clip space, column-major.
  const float xform[9] = {
    2.0f / static_cast<float>(viewW), 0.0f, 0.0f,
    0.0f, -2.0f / static_cast<float>(viewH), 0.0f,
    -1.0f, 1.0f, 1.0f
  };

  glBindVertexArray(vao_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);

  for (const auto& b : scene.batches()) {
    if (b.vertices.empty()) continue;
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(b.vertices.size() * sizeof(float)),
                 b.vertices.data(), GL_STREAM_DRAW);

    if (b.kind == PrimitiveKind::Triangles) {
      solidProg_.use();
      solidProg_.setMat3("u_transform", xform);
      solidProg_.setColor("u_color", b.color);

      GLint aPos = solidProg_.attribLocation("a_pos");
      glEnableVertexAttribArray(static_cast<GLuint>(aPos));
      glVertexAttribPointer(static_cast<GLuint>(aPos), 2, GL_FLOAT, GL_FALSE,
                            2 * sizeof(float), nullptr);

      GLsizei vertexCount = static_cast<GLsizei>(b.vertices.size() / 2);
      glDrawArrays(GL_TRIANGLES, 0, vertexCount);
      stats.drawCalls++;
      stats.triangles += vertexCount / 3;

      glDisableVertexAttribArray(static_cast<GLuint>(aPos));
    } else {
      lineProg_.use();
      lineProg_.setMat3("u_transform", xform);
      lineProg_.setColor("u_color", b.color);
      lineProg_.setFloat("u_lineWidth", b.lineWidth);
      // AA fringe: 1 pixel beyond nominal line edge
      const float aaWidth = 1.0f;
      lineProg_.setFloat("u_aaWidth", aaWidth);
      float hw = b.lineWidth * 0.5f;
      float fringeEdge = (hw > 0.0001f) ? ((hw + aaWidth) / hw) : 2.0f;
      lineProg_.setFloat("u_fringeEdge", fringeEdge);
      lineProg_.setFloat("u_dash", b.dashLength);
      lineProg_.setFloat("u_gap", b.gapLength);

      GLint aRect = lineProg_.attribLocation("a_rect");
      glEnableVertexAttribArray(static_cast<GLuint>(aRect));
      glVertexAttribPointer(static_cast<GLuint>(aRect), 4, GL_FLOAT, GL_FALSE,
                            4 * sizeof(float), nullptr);
      glVertexAttribDivisor(static_cast<GLuint>(aRect), 1);

      GLsizei instanceCount = static_cast<GLsizei>(b.vertices.size() / 4);
      glDrawArraysInstanced(GL_TRIANGLES, 0, 6, instanceCount);
      stats.drawCalls++;
      stats.lineSegments += instanceCount;

      glVertexAttribDivisor(static_cast<GLuint>(aRect), 0);
      glDisableVertexAttribArray(static_cast<GLuint>(aRect));
    }
  }

  glBindBuffer(GL_ARRAY_BUFFER, 0);
  glBindVertexArray(0);
  return stats;
}

} // namespace sc
