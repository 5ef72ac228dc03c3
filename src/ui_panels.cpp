#include "ui_panels.hpp"
#include "app_state.hpp"
#include "progressive_renderer.hpp"
#include "imgui.h"

#include <cstdio>

static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// Keyboard: held keys pan and zoom every frame, presses step iterations
// ---------------------------------------------------------------------------
FrameInput collect_frame_input(const ImGuiIO& io, int drawable_w, int drawable_h,
                               const ViewState& vs)
{
    FrameInput in;

    if (drawable_w >= 0 && drawable_h >= 0 &&
        (static_cast<uint32_t>(drawable_w) != vs.width ||
         static_cast<uint32_t>(drawable_h) != vs.height)) {
        in.has_resize = true;
        in.new_width  = static_cast<uint32_t>(drawable_w);
        in.new_height = static_cast<uint32_t>(drawable_h);
    }

    if (io.WantTextInput)
        return in;

    auto down = [](ImGuiKey a, ImGuiKey b) {
        return ImGui::IsKeyDown(a) || ImGui::IsKeyDown(b);
    };

    if (down(ImGuiKey_W, ImGuiKey_UpArrow))    in.intents |= INTENT_PAN_UP;
    if (down(ImGuiKey_S, ImGuiKey_DownArrow))  in.intents |= INTENT_PAN_DOWN;
    if (down(ImGuiKey_A, ImGuiKey_LeftArrow))  in.intents |= INTENT_PAN_LEFT;
    if (down(ImGuiKey_D, ImGuiKey_RightArrow)) in.intents |= INTENT_PAN_RIGHT;
    if (ImGui::IsKeyDown(ImGuiKey_I))          in.intents |= INTENT_ZOOM_IN;
    if (ImGui::IsKeyDown(ImGuiKey_O))          in.intents |= INTENT_ZOOM_OUT;

    if (ImGui::IsKeyPressed(ImGuiKey_E, false))    in.intents |= INTENT_ITER_UP;
    if (ImGui::IsKeyPressed(ImGuiKey_Q, false))    in.intents |= INTENT_ITER_DOWN;
    if (ImGui::IsKeyPressed(ImGuiKey_Home, false)) in.intents |= INTENT_RESET;
    if (ImGui::IsKeyPressed(ImGuiKey_R, false))    in.export_requested = true;

    return in;
}

// ---------------------------------------------------------------------------
// Fractal image, stretched over the whole window behind every panel
// ---------------------------------------------------------------------------
void draw_render_view(AppState& app, float fw, float fh)
{
    if (app.render_tex.id == 0) return;
    ImGui::GetBackgroundDrawList()->AddImage(app.render_tex.imgui_id(),
                                             ImVec2(0.0f, 0.0f), ImVec2(fw, fh));
}

// ---------------------------------------------------------------------------
// Status bar: view, refinement level, progress, last export
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    const ViewState&      vs = app.frame.vs;
    const RenderProgress& p  = app.frame.progress;

    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::SetNextWindowBgAlpha(0.6f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar           |
        ImGuiWindowFlags_NoInputs);
    ImGui::PopStyleVar();

    char level[32];
    if (p.done())
        std::snprintf(level, sizeof(level), "done");
    else
        std::snprintf(level, sizeof(level), "%3u px  %5.1f%%", p.block_size,
                      100.0 * render_progress_fraction(p, vs.width, vs.height));

    ImGui::Text("x: %.12f   y: %.12f   zoom: %.4gx   iter: %u   [%s]   %llu steps",
                vs.center.real(), vs.center.imag(), zoom_display(vs), vs.max_iter,
                level, static_cast<unsigned long long>(app.last_report.advance_calls));
    if (!app.export_msg.empty()) {
        ImGui::SameLine();
        if (app.export_ok)
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f), "  %s", app.export_msg.c_str());
        else
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "  %s", app.export_msg.c_str());
    }
    ImGui::End();
}

void draw_help_overlay(AppState& app)
{
    ImGui::SetNextWindowPos(ImVec2(12.0f, 12.0f), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.7f);
    ImGui::Begin("Help##overlay", &app.show_help,
        ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings);
    ImGui::TextDisabled("NAVIGATION");
    ImGui::Separator();
    ImGui::Text("W A S D / arrows   pan");
    ImGui::Text("I / O              zoom in / out");
    ImGui::Text("E / Q              double / halve iterations");
    ImGui::Text("Home               reset view");
    ImGui::Spacing();
    ImGui::TextDisabled("OUTPUT");
    ImGui::Separator();
    ImGui::Text("R                  export to %s", app.opts.output_path.c_str());
    ImGui::Text("F1                 toggle this help");
    ImGui::Text("Esc                quit");
    ImGui::End();
}
