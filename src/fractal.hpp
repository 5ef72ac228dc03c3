#pragma once

#include <complex>
#include <cstdint>
#include "view_state.hpp"

// Maps pixel (x, y) to the point of the complex plane it represents.
// The vertical span is aspect-corrected: real_domain * height / width.
// Callers guarantee width > 0 and height > 0.
inline std::complex<double> screen_to_world(uint32_t x, uint32_t y, const ViewState& vs)
{
    const double w  = static_cast<double>(vs.width);
    const double h  = static_cast<double>(vs.height);
    const double px = static_cast<double>(x);
    const double py = static_cast<double>(y);
    const double imag_domain = vs.real_domain * h / w;

    const double re = vs.center.real() + vs.real_domain * (px - w / 2.0) / w;
    const double im = vs.center.imag() + imag_domain    * (py - h / 2.0) / h;
    return {re, im};
}

// Escape time of z_{k+1} = z_k^2 + z0 starting from z_0 = z0: the first n with
// |z_n|^2 >= 4, or max_iter if the orbit stays bounded that long.
inline uint32_t escape_time(std::complex<double> z0, uint32_t max_iter)
{
    const double cr = z0.real();
    const double ci = z0.imag();
    double zr = cr;
    double zi = ci;
    uint32_t n = 0;
    while (n < max_iter) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 >= 4.0)
            break;
        const double new_zr = zr2 - zi2 + cr;
        zi = 2.0*zr*zi + ci;
        zr = new_zr;
        ++n;
    }
    return n;
}
