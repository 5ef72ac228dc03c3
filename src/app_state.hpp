#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "cli_options.hpp"
#include "frame_scheduler.hpp"
#include "renderer.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint   id = 0;
    uint32_t w  = 0;
    uint32_t h  = 0;

    // (Re)allocates when the render target size changes.
    void ensure(uint32_t nw, uint32_t nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, static_cast<GLsizei>(nw),
                     static_cast<GLsizei>(nh), 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const PixelBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, static_cast<GLsizei>(buf.width),
                        static_cast<GLsizei>(buf.height),
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// The texture keeps the last presented buffer until the next present, so
// partially refined frames stay on screen.
class TexturePresenter : public IPresenter {
public:
    explicit TexturePresenter(GlTex& tex_) : tex(tex_) {}

    void present(const PixelBuffer& buf) override {
        tex.ensure(buf.width, buf.height);
        tex.upload(buf);
    }

private:
    GlTex& tex;
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    AppOptions   opts;
    FrameContext frame;
    FrameReport  last_report;
    GlTex        render_tex;

    bool        show_help  = false;
    std::string export_msg;   // last export result, shown in the status bar
    bool        export_ok  = false;

    explicit AppState(const AppOptions& o) : opts(o), frame(o.initial) {}
};
