#pragma once

#include "frame_scheduler.hpp"

struct AppState;
struct ImGuiIO;

// Key-to-intent mapping for one frame. A drawable size different from the
// current view is reported as a resize.
FrameInput collect_frame_input(const ImGuiIO& io, int drawable_w, int drawable_h,
                               const ViewState& vs);

void draw_render_view(AppState& app, float fw, float fh);
void draw_status_bar(AppState& app, float fw, float fh);
void draw_help_overlay(AppState& app);
