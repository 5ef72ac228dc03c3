#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "cli_benchmark.hpp"
#include "cli_options.hpp"
#include "export.hpp"
#include "frame_scheduler.hpp"
#include "ui_panels.hpp"

#include <chrono>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Interactive frame loop; returns when the window is closed
// ---------------------------------------------------------------------------
static void run_event_loop(SDL_Window* window, AppOptions opts)
{
    ImGuiIO& io = ImGui::GetIO();

    int dw = 0, dh = 0;
    SDL_GL_GetDrawableSize(window, &dw, &dh);
    if (dw > 0 && dh > 0) {
        opts.initial.width  = static_cast<uint32_t>(dw);
        opts.initial.height = static_cast<uint32_t>(dh);
    }

    AppState         app(opts);
    SteadyFrameClock clock;
    TexturePresenter presenter(app.render_tex);
    FrameScheduler   scheduler(clock, presenter, std::chrono::milliseconds(opts.budget_ms));
    scheduler.set_verbose(opts.verbose);

    auto update_title = [&]() {
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "Brot Explorer  [zoom: %.4gx  iter: %u]",
                      zoom_display(app.frame.vs), app.frame.vs.max_iter);
        SDL_SetWindowTitle(window, tbuf);
    };
    update_title();

    bool running = true;
    while (running) {
        const auto frame_start = clock.now();

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h, draw_w, draw_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        SDL_GL_GetDrawableSize(window, &draw_w, &draw_h);
        const float fw = static_cast<float>(win_w);
        const float fh = static_cast<float>(win_h);

        const FrameInput in = collect_frame_input(io, draw_w, draw_h, app.frame.vs);
        if (ImGui::IsKeyPressed(ImGuiKey_Escape, false))
            running = false;
        if (ImGui::IsKeyPressed(ImGuiKey_F1, false))
            app.show_help = !app.show_help;

        // Export sees the buffer as painted so far, before this frame's changes.
        if (in.export_requested) {
            app.export_msg = export_image(app.opts.output_path, app.frame.pbuf);
            app.export_ok  = app.export_msg.empty();
            if (app.export_ok) {
                printf("Saved: %s\n", app.opts.output_path.c_str());
                app.export_msg = "Saved: " + app.opts.output_path;
            } else {
                fprintf(stderr, "Export failed: %s\n", app.export_msg.c_str());
            }
        }

        app.last_report = scheduler.run_frame(app.frame, in, frame_start);
        if (app.last_report.view_changed)
            update_title();

        draw_render_view(app, fw, fh);
        draw_status_bar(app, fw, fh);
        if (app.show_help)
            draw_help_overlay(app);

        ImGui::Render();
        glViewport(0, 0, draw_w, draw_h);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    AppOptions opts;
    const std::string opt_err = parse_cli_options(argc, argv, opts);
    if (!opt_err.empty()) {
        fprintf(stderr, "%s\n", opt_err.c_str());
        fprintf(stderr, "Try '%s --help'.\n", argv[0]);
        return 2;
    }
    if (opts.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts.mode == RUN_BENCHMARK)
        return run_cli_benchmark(opts);
    if (opts.mode == RUN_RENDER)
        return run_cli_render(opts);

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "Brot Explorer",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        static_cast<int>(opts.initial.width), static_cast<int>(opts.initial.height),
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(0);  // FrameScheduler paces frames

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    run_event_loop(window, opts);

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
