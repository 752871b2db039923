#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#if defined(__APPLE__)
#define GL_SILENCE_DEPRECATION
#endif
#define RGFW_OPENGL
#define RGFW_IMPLEMENTATION
#include "RGFW.h"

#if defined(__APPLE__)
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

#ifndef GL_MULTISAMPLE
#define GL_MULTISAMPLE 0x809D
#endif

#include "app_config.h"
#include "app_state.h"
#include "build_session.h"
#include "interaction_state.h"
#include "mesh_compiler.h"
#include "openscad_compiler.h"
#include "picking.h"
#include "placement.h"
#include "render_scene.h"
#include "scene_runtime.h"
#include "solid_compiler.h"

using bricked_app::Vec3;
using bricked_app::CameraBasis;
using bricked_app::add;
using bricked_app::mul;
using bricked_interaction::ViewerCamera;

static constexpr int kRequestedMsaaSamples = 4;
static constexpr int kGridHalfCells = 32;

// Number keys 1-9.
static const char *const kPalette[9] = {
    "#c91a09", "#fe8a18", "#f2cd37", "#237841", "#0055bf",
    "#81007b", "#a0a5a9", "#6c6e68", "#1b2a34",
};

static void set_perspective(float fov_degrees, float aspect, float z_near, float z_far) {
    const float top = std::tan(bricked_app::deg_to_rad(fov_degrees) * 0.5f) * z_near;
    const float right = top * aspect;
    glFrustum(-right, right, -top, top, z_near, z_far);
}

static void apply_look_at(const Vec3 &eye, const CameraBasis &basis) {
    const float view[16] = {
        basis.right.x, basis.up.x, -basis.forward.x, 0.0f,
        basis.right.y, basis.up.y, -basis.forward.y, 0.0f,
        basis.right.z, basis.up.z, -basis.forward.z, 0.0f,
        0.0f, 0.0f, 0.0f, 1.0f,
    };
    glMultMatrixf(view);
    glTranslatef(-eye.x, -eye.y, -eye.z);
}

static Vec3 light_anchor(const Vec3 &eye, const CameraBasis &basis,
                         float right, float up, float forward) {
    Vec3 p = eye;
    p = add(p, mul(basis.right, right));
    p = add(p, mul(basis.up, up));
    p = add(p, mul(basis.forward, forward));
    return p;
}

static void setup_lighting() {
    glEnable(GL_MULTISAMPLE);
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_CULL_FACE);
    glCullFace(GL_BACK);
    glEnable(GL_COLOR_MATERIAL);
    glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);
    glShadeModel(GL_SMOOTH);
    glEnable(GL_NORMALIZE);
    glEnable(GL_LIGHTING);
    glEnable(GL_LIGHT0);
    glEnable(GL_LIGHT1);
    glEnable(GL_LIGHT2);
    glLightModeli(GL_LIGHT_MODEL_LOCAL_VIEWER, GL_TRUE);
    glLightModeli(GL_LIGHT_MODEL_TWO_SIDE, GL_FALSE);
    const float global_ambient[4] = {0.14f, 0.15f, 0.17f, 1.0f};
    glLightModelfv(GL_LIGHT_MODEL_AMBIENT, global_ambient);
    glClearColor(0.11f, 0.12f, 0.15f, 1.0f);

    const float light0_ambient[4] = {0.10f, 0.10f, 0.11f, 1.0f};
    const float light0_diffuse[4] = {0.92f, 0.95f, 1.00f, 1.0f};
    const float light0_specular[4] = {0.88f, 0.92f, 0.98f, 1.0f};
    const float light1_ambient[4] = {0.03f, 0.03f, 0.04f, 1.0f};
    const float light1_diffuse[4] = {0.44f, 0.50f, 0.58f, 1.0f};
    const float light1_specular[4] = {0.18f, 0.20f, 0.24f, 1.0f};
    const float light2_ambient[4] = {0.00f, 0.00f, 0.00f, 1.0f};
    const float light2_diffuse[4] = {0.32f, 0.33f, 0.37f, 1.0f};
    const float light2_specular[4] = {0.60f, 0.64f, 0.72f, 1.0f};
    const float mat_specular[4] = {0.30f, 0.30f, 0.32f, 1.0f};
    glLightfv(GL_LIGHT0, GL_AMBIENT, light0_ambient);
    glLightfv(GL_LIGHT0, GL_DIFFUSE, light0_diffuse);
    glLightfv(GL_LIGHT0, GL_SPECULAR, light0_specular);
    glLightfv(GL_LIGHT1, GL_AMBIENT, light1_ambient);
    glLightfv(GL_LIGHT1, GL_DIFFUSE, light1_diffuse);
    glLightfv(GL_LIGHT1, GL_SPECULAR, light1_specular);
    glLightfv(GL_LIGHT2, GL_AMBIENT, light2_ambient);
    glLightfv(GL_LIGHT2, GL_DIFFUSE, light2_diffuse);
    glLightfv(GL_LIGHT2, GL_SPECULAR, light2_specular);
    glMaterialfv(GL_FRONT_AND_BACK, GL_SPECULAR, mat_specular);
    glMaterialf(GL_FRONT_AND_BACK, GL_SHININESS, 40.0f);
}

static std::unique_ptr<bricked::MeshCompiler> make_compiler(const bricked::AppConfig &config) {
    if (config.compiler == bricked::CompilerBackend::OpenScad) {
        bricked::OpenScadCompilerOptions options;
        options.executable = config.openscadExecutable;
        options.maxProcesses = config.compileWorkers > 0 ? config.compileWorkers : 1;
        return std::make_unique<bricked::OpenScadMeshCompiler>(options);
    }
    return std::make_unique<bricked::ManifoldMeshCompiler>(config.compileWorkers);
}

static std::string window_title(const bricked_scene::BuildSession &session, const std::string &notice) {
    const bricked::PlacementEngine &placement = session.placement();
    const bricked::SnapSettings &snap = placement.snap();
    char head[256];
    std::snprintf(head, sizeof(head), "bricked | step %zu/%zu | %s | %s %s %s | snap %s%s%s",
                  session.steps().cursor(), session.steps().part_count(),
                  session.StatusLine().c_str(),
                  bricked::PlacementStateName(placement.state()),
                  bricked::HandleModeName(placement.mode()),
                  bricked::AxisConstraintName(placement.axis()),
                  snap.enabled ? "on" : "off",
                  snap.toGrid ? "" : " no-grid",
                  snap.toLevels ? "" : " no-levels");
    std::string title = head;
    if (placement.selected() >= 0) title += " | " + placement.selected_color_hex();
    title += " | " + session.InstructionLine();
    if (!notice.empty()) title += " | " + notice;
    return title;
}

static bool ctrl_down(RGFW_window *win) {
    return RGFW_window_isKeyDown(win, RGFW_controlL) || RGFW_window_isKeyDown(win, RGFW_controlR);
}

int main(int argc, char **argv) {
    bricked::AppConfig config;
    std::string config_error;
    if (!bricked::ParseAppConfig(argc, argv, &config, &config_error)) {
        std::fprintf(stderr, "bricked: %s\n%s", config_error.c_str(), bricked::AppConfigUsage(argv[0]).c_str());
        return 2;
    }
    if (config.showHelp) {
        std::fputs(bricked::AppConfigUsage(argv[0]).c_str(), stdout);
        return 0;
    }

    std::unique_ptr<bricked::MeshCompiler> compiler = make_compiler(config);
    std::fprintf(stderr, "[bricked] compiler=%s workers=%zu description=%s\n",
                 bricked::CompilerBackendName(config.compiler), config.compileWorkers,
                 config.descriptionPath.c_str());
    bricked_scene::BuildSession session(compiler.get(), config.geometry);
    session.placement().snap() = config.snap;

    std::string load_error;
    if (!session.LoadDescriptionFile(config.descriptionPath, &load_error)) {
        std::fprintf(stderr, "[bricked] %s\n", load_error.c_str());
    }

    static RGFW_glHints gl_hints = RGFW_DEFAULT_GL_HINTS;
    gl_hints.samples = kRequestedMsaaSamples;
    RGFW_setGlobalHints_OpenGL(&gl_hints);

    RGFW_window *win = RGFW_createWindow(
        "bricked",
        100,
        100,
        config.windowWidth,
        config.windowHeight,
        (RGFW_windowFlags)(RGFW_windowCenter | RGFW_windowOpenGL));
    if (win == nullptr) return 1;

    // Escape deselects; closing the window quits.
    RGFW_window_setExitKey(win, RGFW_keyNULL);
    RGFW_window_makeCurrentContext_OpenGL(win);
    setup_lighting();
    RGFW_window_swapInterval_OpenGL(win, 1);

    RGFW_event event;
    i32 width = 0;
    i32 height = 0;
    i32 window_w = 0;
    i32 window_h = 0;
    RGFW_window_getSizeInPixels(win, &width, &height);
    RGFW_window_getSize(win, &window_w, &window_h);

    ViewerCamera camera;
    camera.fov_degrees = config.fovDegrees;
    bool framed = false;
    i32 last_mouse_x = 0;
    i32 last_mouse_y = 0;
    bool have_last_mouse = false;
    bool drag_moved = false;
    std::string notice;
    std::string title;
    std::string last_reload_error = load_error;

    auto pick_ray = [&]() {
        i32 mouse_x = 0;
        i32 mouse_y = 0;
        RGFW_window_getMouse(win, &mouse_x, &mouse_y);
        int px = 0;
        int py = 0;
        bricked_picking::WindowMouseToPixel(mouse_x, mouse_y, window_w, window_h, width, height, &px, &py);
        bricked_picking::PickContext ctx;
        ctx.viewport_width = width;
        ctx.viewport_height = height;
        ctx.fov_degrees = camera.fov_degrees;
        ctx.eye = bricked_interaction::CameraPosition(camera);
        ctx.basis = bricked_interaction::CameraBasisFor(ctx.eye, camera.target);
        return bricked_picking::CameraRay(px, py, ctx);
    };

    auto focus_all = [&]() {
        Vec3 bmin;
        Vec3 bmax;
        if (bricked_scene::ComputeSceneBounds(session.scene().entries(), false, &bmin, &bmax)) {
            bricked_interaction::FocusCameraOnBounds(&camera, bmin, bmax);
            return true;
        }
        return false;
    };

    while (!RGFW_window_shouldClose(win)) {
        std::string reload_error;
        if (!session.ReloadIfChanged(&reload_error) && reload_error != last_reload_error) {
            std::fprintf(stderr, "[bricked] %s\n", reload_error.c_str());
        }
        last_reload_error = reload_error;
        session.Tick();
        if (!framed) framed = focus_all();

        bricked::PlacementEngine &placement = session.placement();
        while (RGFW_window_checkEvent(win, &event)) {
            if (event.type == RGFW_quit) break;
            if (event.type == RGFW_windowResized || event.type == RGFW_scaleUpdated) {
                RGFW_window_getSizeInPixels(win, &width, &height);
                RGFW_window_getSize(win, &window_w, &window_h);
            }
            if (event.type == RGFW_keyPressed) {
                const RGFW_key key = event.key.value;
                if (key == RGFW_w) {
                    placement.SetMode(bricked::HandleMode::Translate);
                } else if (key == RGFW_e) {
                    placement.SetMode(bricked::HandleMode::Rotate);
                } else if (key == RGFW_x || key == RGFW_y || key == RGFW_z) {
                    const bricked::AxisConstraint axis = key == RGFW_x   ? bricked::AxisConstraint::X
                                                         : key == RGFW_y ? bricked::AxisConstraint::Y
                                                                         : bricked::AxisConstraint::Z;
                    placement.SetAxis(placement.axis() == axis ? bricked::AxisConstraint::Free : axis);
                } else if (key == RGFW_return) {
                    session.steps().Advance();
                } else if (key == RGFW_backSpace) {
                    session.steps().Retreat();
                } else if (key == RGFW_home) {
                    session.steps().JumpToStart();
                } else if (key == RGFW_end) {
                    session.steps().JumpToEnd();
                } else if (key == RGFW_escape) {
                    placement.Deselect();
                } else if (key == RGFW_g) {
                    placement.snap().enabled = !placement.snap().enabled;
                } else if (key == RGFW_r) {
                    bricked_interaction::ResetCamera(&camera);
                } else if (key == RGFW_f) {
                    const int sel = placement.selected();
                    Vec3 bmin;
                    Vec3 bmax;
                    if (sel >= 0 && (size_t)sel < session.scene().size() &&
                        bricked_scene::ComputeEntryBounds(session.scene()[(size_t)sel], &bmin, &bmax)) {
                        bricked_interaction::FocusCameraOnBounds(&camera, bmin, bmax);
                    } else {
                        focus_all();
                    }
                } else if (key == RGFW_s) {
                    // Shift+S writes 3MF instead of STL.
                    const bool three_mf = RGFW_window_isKeyDown(win, RGFW_shiftL) ||
                                          RGFW_window_isKeyDown(win, RGFW_shiftR);
                    const std::string out_name = bricked_runtime::MakeExportFilename(three_mf ? "3mf" : "stl");
                    std::string export_error;
                    const bool saved = three_mf ? session.Export3mf(out_name, &export_error)
                                                : session.ExportStl(out_name, &export_error);
                    if (saved) {
                        notice = "saved " + out_name;
                    } else {
                        notice = export_error.empty() ? "export failed" : export_error;
                    }
                } else if (key == RGFW_t) {
                    placement.snap().toGrid = !placement.snap().toGrid;
                } else if (key == RGFW_l) {
                    placement.snap().toLevels = !placement.snap().toLevels;
                } else if (key == RGFW_bracket || key == RGFW_closeBracket ||
                           key == RGFW_minus || key == RGFW_equals ||
                           key == RGFW_semicolon || key == RGFW_apostrophe ||
                           key == RGFW_comma || key == RGFW_period) {
                    bricked::GeometryField field = bricked::GeometryField::CircularSegments;
                    if (key == RGFW_minus || key == RGFW_equals) field = bricked::GeometryField::StudDiameter;
                    if (key == RGFW_semicolon || key == RGFW_apostrophe) field = bricked::GeometryField::StudHeight;
                    if (key == RGFW_comma || key == RGFW_period) field = bricked::GeometryField::WallGap;
                    const bool down = key == RGFW_bracket || key == RGFW_minus ||
                                      key == RGFW_semicolon || key == RGFW_comma;
                    if (session.SetGeometryParameters(
                            bricked::StepGeometryParameter(session.params(), field, down ? -1 : 1))) {
                        notice = bricked::FormatGeometryParameters(session.params());
                    } else {
                        notice = std::string(bricked::GeometryFieldName(field)) + " at limit";
                    }
                } else if (key >= RGFW_1 && key <= RGFW_9) {
                    std::string color_error;
                    if (placement.selected() >= 0 &&
                        !placement.ApplyColorHex(kPalette[key - RGFW_1], &color_error)) {
                        notice = color_error;
                    }
                }
            }
            if (event.type == RGFW_mouseScroll) {
                bricked_interaction::ZoomCamera(&camera, event.scroll.y);
            }
            if (event.type == RGFW_mousePosChanged) {
                if (!have_last_mouse) {
                    last_mouse_x = event.mouse.x;
                    last_mouse_y = event.mouse.y;
                    have_last_mouse = true;
                }
                const i32 dx = event.mouse.x - last_mouse_x;
                const i32 dy = event.mouse.y - last_mouse_y;
                last_mouse_x = event.mouse.x;
                last_mouse_y = event.mouse.y;

                const bool shift_down = RGFW_window_isKeyDown(win, RGFW_shiftL) ||
                                        RGFW_window_isKeyDown(win, RGFW_shiftR);
                const bool alt_down = RGFW_window_isKeyDown(win, RGFW_altL) ||
                                      RGFW_window_isKeyDown(win, RGFW_altR);
                const bool orbit_down = RGFW_window_isMouseDown(win, RGFW_mouseRight) ||
                                        RGFW_window_isMouseDown(win, RGFW_mouseMiddle) ||
                                        (alt_down && RGFW_window_isMouseDown(win, RGFW_mouseLeft));

                if (placement.state() == bricked::PlacementState::Dragging) {
                    if ((dx != 0 || dy != 0) && placement.DragTo(pick_ray())) drag_moved = true;
                } else if (orbit_down && !shift_down) {
                    bricked_interaction::OrbitCamera(&camera, dx, dy);
                } else if (orbit_down && shift_down) {
                    bricked_interaction::PanCamera(&camera, dx, dy, height);
                }
            }
            if (event.type == RGFW_mouseButtonPressed && event.button.value == RGFW_mouseLeft) {
                const bool alt_down = RGFW_window_isKeyDown(win, RGFW_altL) ||
                                      RGFW_window_isKeyDown(win, RGFW_altR);
                if (!alt_down) {
                    const bricked_app::Ray ray = pick_ray();
                    if (placement.Pick(ray) >= 0) {
                        drag_moved = false;
                        placement.BeginDrag(ray);
                    }
                }
            }
            if (event.type == RGFW_mouseButtonReleased && event.button.value == RGFW_mouseLeft) {
                if (placement.state() == bricked::PlacementState::Dragging) {
                    if (drag_moved) {
                        placement.EndDrag(ctrl_down(win));
                    } else {
                        placement.CancelDrag();
                    }
                }
            }
        }
        session.SyncScene();

        const std::string next_title = window_title(session, notice);
        if (next_title != title) {
            title = next_title;
            RGFW_window_setName(win, title.c_str());
        }

        if (height <= 0) height = 1;
        glViewport(0, 0, width, height);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        set_perspective(camera.fov_degrees, (float)width / (float)height, 0.5f, 8000.0f);

        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
        const Vec3 eye = bricked_interaction::CameraPosition(camera);
        const CameraBasis basis = bricked_interaction::CameraBasisFor(eye, camera.target);
        apply_look_at(eye, basis);

        const float d = camera.distance;
        const Vec3 key = light_anchor(eye, basis, d * 0.72f, d * 0.95f, d * 0.38f);
        const Vec3 fill = light_anchor(eye, basis, -d * 0.90f, d * 0.25f, d * 0.10f);
        const Vec3 rim = light_anchor(eye, basis, d * 0.15f, d * 0.56f, -d * 1.25f);
        const float key_pos[4] = {key.x, key.y, key.z, 1.0f};
        const float fill_pos[4] = {fill.x, fill.y, fill.z, 1.0f};
        const float rim_pos[4] = {rim.x, rim.y, rim.z, 1.0f};
        glLightfv(GL_LIGHT0, GL_POSITION, key_pos);
        glLightfv(GL_LIGHT1, GL_POSITION, fill_pos);
        glLightfv(GL_LIGHT2, GL_POSITION, rim_pos);

        bricked_render_scene::DrawGrid(kGridHalfCells);
        bricked_render_scene::DrawScene(session.scene());

        RGFW_window_swapBuffers_OpenGL(win);
    }

    RGFW_window_close(win);
    return 0;
}
