#pragma once

#include "renderer.hpp"
#include "view_state.hpp"
#include "progressive_renderer.hpp"

#include <chrono>
#include <cstdint>

// Navigation intents active during one frame (bit flags).
enum FrameIntent : uint32_t {
    INTENT_PAN_UP    = 1u << 0,
    INTENT_PAN_DOWN  = 1u << 1,
    INTENT_PAN_LEFT  = 1u << 2,
    INTENT_PAN_RIGHT = 1u << 3,
    INTENT_ZOOM_IN   = 1u << 4,
    INTENT_ZOOM_OUT  = 1u << 5,
    INTENT_ITER_UP   = 1u << 6,
    INTENT_ITER_DOWN = 1u << 7,
    INTENT_RESET     = 1u << 8,
};

constexpr double PAN_FRACTION = 0.02;  // of real_domain, per frame
constexpr double ZOOM_FACTOR  = 0.95;  // real_domain multiplier per frame

// Everything the input collector reports for one frame.
struct FrameInput {
    uint32_t intents          = 0;
    bool     export_requested = false;
    bool     has_resize       = false;
    uint32_t new_width        = 0;
    uint32_t new_height       = 0;

    bool has(FrameIntent i) const { return (intents & i) != 0; }
};

// Builds the candidate view for this frame from the current one. `home` is
// the view restored by INTENT_RESET. A zero-area resize is ignored.
ViewState apply_frame_input(const ViewState& vs, const FrameInput& in, const ViewState& home);

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------
class IFrameClock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::steady_clock::duration;

    virtual ~IFrameClock() = default;
    virtual time_point now() = 0;
    virtual void sleep_for(duration d) = 0;
};

class SteadyFrameClock : public IFrameClock {
public:
    time_point now() override;
    void sleep_for(duration d) override;
};

// Receives the fully painted buffer at the end of a rendering frame.
class IPresenter {
public:
    virtual ~IPresenter() = default;
    virtual void present(const PixelBuffer& buf) = 0;
};

// ---------------------------------------------------------------------------
// Frame loop state, owned by the caller and passed in every frame
// ---------------------------------------------------------------------------
struct FrameContext {
    ViewState      vs;
    ViewState      home;
    RenderProgress progress;
    PixelBuffer    pbuf;

    explicit FrameContext(const ViewState& initial)
        : vs(initial), home(initial)
    {
        pbuf.resize(initial.width, initial.height);
    }
};

struct FrameReport {
    bool     view_changed  = false;
    bool     rendered      = false;  // advance loop ran and the buffer was presented
    bool     slept         = false;
    uint64_t advance_calls = 0;
};

class FrameScheduler {
public:
    static constexpr std::chrono::milliseconds DEFAULT_BUDGET{16};

    FrameScheduler(IFrameClock& clock, IPresenter& presenter,
                   std::chrono::nanoseconds budget = DEFAULT_BUDGET);

    // One presentation frame; the deadline is measured from `frame_start`.
    FrameReport run_frame(FrameContext& ctx, const FrameInput& in,
                          IFrameClock::time_point frame_start);
    FrameReport run_frame(FrameContext& ctx, const FrameInput& in);

    std::chrono::nanoseconds budget() const { return budget_; }
    void set_verbose(bool v) { verbose = v; }

private:
    IFrameClock&             clock;
    IPresenter&              presenter;
    std::chrono::nanoseconds budget_;
    bool                     verbose = false;
    bool                     zero_resize_logged = false;  // while minimised
    IFrameClock::time_point  level_start{};
};
