#include "render_scene.h"

#if defined(__APPLE__)
#define GL_SILENCE_DEPRECATION
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

#include "part_catalog.h"

namespace bricked_render_scene {

namespace {

void push_entry_transform(const bricked::SceneEntry &entry) {
  glPushMatrix();
  glTranslatef(entry.position.x, entry.position.y, entry.position.z);
  // R = Rx * Ry * Rz
  glRotatef(entry.rotationDeg.x, 1.0f, 0.0f, 0.0f);
  glRotatef(entry.rotationDeg.y, 0.0f, 1.0f, 0.0f);
  glRotatef(entry.rotationDeg.z, 0.0f, 0.0f, 1.0f);
}

void emit_triangles(const bricked::PartMesh &part) {
  const manifold::MeshGL &mesh = part.mesh;
  const size_t np = mesh.numProp;
  glBegin(GL_TRIANGLES);
  for (uint32_t idx : mesh.triVerts) {
    const float *p = &mesh.vertProperties[(size_t)idx * np];
    if (np >= 6) glNormal3f(p[3], p[4], p[5]);
    glVertex3f(p[0], p[1], p[2]);
  }
  glEnd();
}

void draw_entry(const bricked::SceneEntry &entry, float alpha) {
  if (!entry.mesh) return;
  push_entry_transform(entry);
  glColor4f(entry.color.r, entry.color.g, entry.color.b, alpha);
  emit_triangles(*entry.mesh);
  glPopMatrix();
}

void draw_box_outline(const bricked_app::Vec3 &mn, const bricked_app::Vec3 &mx) {
  const float xs[2] = {mn.x, mx.x};
  const float ys[2] = {mn.y, mx.y};
  const float zs[2] = {mn.z, mx.z};
  glBegin(GL_LINES);
  for (int a = 0; a < 2; ++a) {
    for (int b = 0; b < 2; ++b) {
      glVertex3f(xs[0], ys[a], zs[b]); glVertex3f(xs[1], ys[a], zs[b]);
      glVertex3f(xs[a], ys[0], zs[b]); glVertex3f(xs[a], ys[1], zs[b]);
      glVertex3f(xs[a], ys[b], zs[0]); glVertex3f(xs[a], ys[b], zs[1]);
    }
  }
  glEnd();
}

void draw_emphasis(const bricked::SceneEntry &entry) {
  if (!entry.mesh || !entry.visible || entry.emphasis == bricked::Emphasis::None) return;
  glDisable(GL_LIGHTING);
  glDisable(GL_DEPTH_TEST);
  glLineWidth(2.0f);
  if (entry.emphasis == bricked::Emphasis::Selected) {
    glColor3f(1.00f, 0.82f, 0.20f);
  } else {
    glColor3f(0.35f, 0.85f, 1.00f);
  }
  push_entry_transform(entry);
  const bricked_app::Vec3 pad = {0.15f, 0.15f, 0.15f};
  draw_box_outline(bricked_app::sub(entry.mesh->bmin, pad), bricked_app::add(entry.mesh->bmax, pad));
  glPopMatrix();
  glLineWidth(1.0f);
  glEnable(GL_DEPTH_TEST);
  glEnable(GL_LIGHTING);
}

}  // namespace

void DrawGrid(int half_cells) {
  const float step = (float)bricked::kStudPitch;
  const float extent = (float)half_cells * step;

  glDisable(GL_LIGHTING);
  glLineWidth(1.0f);
  glBegin(GL_LINES);
  for (int i = -half_cells; i <= half_cells; ++i) {
    const float k = (float)i * step;
    const bool major = (i % 4) == 0;

    if (i == 0) {
      glColor3f(0.86f, 0.30f, 0.30f);
    } else {
      const float c = major ? 0.30f : 0.20f;
      glColor3f(c, c, c);
    }
    glVertex3f(k, 0.0f, -extent);
    glVertex3f(k, 0.0f, extent);

    if (i == 0) {
      glColor3f(0.30f, 0.56f, 0.90f);
    } else {
      const float c = major ? 0.30f : 0.20f;
      glColor3f(c, c, c);
    }
    glVertex3f(-extent, 0.0f, k);
    glVertex3f(extent, 0.0f, k);
  }
  glEnd();
  glEnable(GL_LIGHTING);
}

void DrawScene(const bricked::SceneModel &scene) {
  const std::vector<bricked::SceneEntry> &entries = scene.entries();
  for (const bricked::SceneEntry &entry : entries) {
    if (entry.visible && !entry.placeholder) draw_entry(entry, 1.0f);
  }

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glDepthMask(GL_FALSE);
  for (const bricked::SceneEntry &entry : entries) {
    if (entry.visible && entry.placeholder) draw_entry(entry, kPlaceholderOpacity);
  }
  glDepthMask(GL_TRUE);
  glDisable(GL_BLEND);

  for (const bricked::SceneEntry &entry : entries) draw_emphasis(entry);
}

}  // namespace bricked_render_scene
