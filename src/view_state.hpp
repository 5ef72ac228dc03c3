#pragma once

#include <cmath>
#include <complex>
#include <cstdint>

constexpr uint32_t MIN_MAX_ITER = 1;
constexpr uint32_t MAX_MAX_ITER = 1u << 20;

struct ViewState {
    std::complex<double> center      = {0.0, 0.0};
    uint32_t             width       = 800;
    uint32_t             height      = 600;
    double               real_domain = 4.0;  // width of viewport in complex-plane units
    uint32_t             max_iter    = 64;
};

// Compared field by field every frame; any difference restarts the render.
inline bool operator==(const ViewState& a, const ViewState& b)
{
    return a.center      == b.center
        && a.width       == b.width
        && a.height      == b.height
        && a.real_domain == b.real_domain
        && a.max_iter    == b.max_iter;
}

inline bool operator!=(const ViewState& a, const ViewState& b)
{
    return !(a == b);
}

inline double zoom_display(const ViewState& vs)
{
    return 4.0 / vs.real_domain;
}

inline uint32_t clamp_max_iter(uint64_t n)
{
    if (n < MIN_MAX_ITER) return MIN_MAX_ITER;
    if (n > MAX_MAX_ITER) return MAX_MAX_ITER;
    return static_cast<uint32_t>(n);
}

inline bool view_state_valid(const ViewState& vs)
{
    return vs.width > 0 && vs.height > 0
        && std::isfinite(vs.real_domain) && vs.real_domain > 0.0
        && std::isfinite(vs.center.real()) && std::isfinite(vs.center.imag())
        && vs.max_iter >= MIN_MAX_ITER && vs.max_iter <= MAX_MAX_ITER;
}

// Reset navigation (center, zoom, iterations) to `initial` while keeping the
// current render target size.
inline void reset_view_keep_size(ViewState& vs, const ViewState& initial)
{
    const uint32_t w = vs.width;
    const uint32_t h = vs.height;
    vs        = initial;
    vs.width  = w;
    vs.height = h;
}
