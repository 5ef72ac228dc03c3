#include "frame_scheduler.hpp"

#include <cmath>
#include <cstdio>
#include <thread>

ViewState apply_frame_input(const ViewState& vs, const FrameInput& in, const ViewState& home)
{
    ViewState next = vs;

    if (in.has(INTENT_RESET))
        reset_view_keep_size(next, home);

    if (in.has_resize && in.new_width > 0 && in.new_height > 0) {
        next.width  = in.new_width;
        next.height = in.new_height;
    }

    if (in.has(INTENT_ITER_DOWN))
        next.max_iter = clamp_max_iter(next.max_iter / 2);
    else if (in.has(INTENT_ITER_UP))
        next.max_iter = clamp_max_iter(static_cast<uint64_t>(next.max_iter) * 2);

    // A pan or zoom step that would leave the finite range is dropped.
    const double step = PAN_FRACTION * next.real_domain;
    std::complex<double> center = next.center;
    if (in.has(INTENT_PAN_UP))    center -= std::complex<double>(0.0, step);
    if (in.has(INTENT_PAN_DOWN))  center += std::complex<double>(0.0, step);
    if (in.has(INTENT_PAN_LEFT))  center -= step;
    if (in.has(INTENT_PAN_RIGHT)) center += step;
    if (std::isfinite(center.real()) && std::isfinite(center.imag()))
        next.center = center;

    double domain = next.real_domain;
    if (in.has(INTENT_ZOOM_IN))  domain *= ZOOM_FACTOR;
    if (in.has(INTENT_ZOOM_OUT)) domain /= ZOOM_FACTOR;
    if (std::isfinite(domain) && domain > 0.0)
        next.real_domain = domain;

    return next;
}

IFrameClock::time_point SteadyFrameClock::now()
{
    return std::chrono::steady_clock::now();
}

void SteadyFrameClock::sleep_for(duration d)
{
    std::this_thread::sleep_for(d);
}

FrameScheduler::FrameScheduler(IFrameClock& clock_, IPresenter& presenter_,
                               std::chrono::nanoseconds budget)
    : clock(clock_), presenter(presenter_), budget_(budget)
{
}

FrameReport FrameScheduler::run_frame(FrameContext& ctx, const FrameInput& in)
{
    return run_frame(ctx, in, clock.now());
}

FrameReport FrameScheduler::run_frame(FrameContext& ctx, const FrameInput& in,
                                      IFrameClock::time_point frame_start)
{
    using ms = std::chrono::duration<double, std::milli>;
    FrameReport report;

    const bool zero_area = in.has_resize && (in.new_width == 0 || in.new_height == 0);
    if (zero_area && !zero_resize_logged)
        fprintf(stderr, "Ignoring resize to zero-area target %ux%u\n",
                in.new_width, in.new_height);
    zero_resize_logged = zero_area;

    // Change detection always precedes rendering.
    const ViewState next = apply_frame_input(ctx.vs, in, ctx.home);
    if (next != ctx.vs) {
        if (next.width != ctx.vs.width || next.height != ctx.vs.height)
            ctx.pbuf.resize(next.width, next.height);
        ctx.vs       = next;
        ctx.progress = RenderProgress{};
        report.view_changed = true;
        if (verbose)
            fprintf(stderr, "view: center (%.17g, %.17g)  domain %.6g  iter %u  %ux%u\n",
                    ctx.vs.center.real(), ctx.vs.center.imag(), ctx.vs.real_domain,
                    ctx.vs.max_iter, ctx.vs.width, ctx.vs.height);
    }

    if (!ctx.progress.done()) {
        if (ctx.progress == RenderProgress{})
            level_start = frame_start;
        while (!ctx.progress.done() && clock.now() - frame_start < budget_) {
            const uint32_t bs = ctx.progress.block_size;
            const RenderStep step = advance(ctx.pbuf, ctx.vs, ctx.progress);
            ++report.advance_calls;
            if (verbose && step == RenderStep::Halve) {
                const auto t = clock.now();
                fprintf(stderr, "level %3u px done in %.1f ms\n",
                        bs, ms(t - level_start).count());
                level_start = t;
            }
        }
        presenter.present(ctx.pbuf);
        report.rendered = true;
    } else {
        const auto remaining = budget_ - (clock.now() - frame_start);
        if (remaining > std::chrono::nanoseconds::zero()) {
            clock.sleep_for(std::chrono::duration_cast<IFrameClock::duration>(remaining));
            report.slept = true;
        }
    }
    return report;
}
