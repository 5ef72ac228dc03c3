#include <gtest/gtest.h>

#include "fractal.hpp"
#include "palette.hpp"
#include "view_state.hpp"

#include <cmath>
#include <limits>

static ViewState make_view(uint32_t w, uint32_t h, std::complex<double> c, double domain)
{
    ViewState vs;
    vs.width       = w;
    vs.height      = h;
    vs.center      = c;
    vs.real_domain = domain;
    return vs;
}

TEST(ScreenToWorld, CenterPixelMapsToCenter)
{
    const ViewState vs = make_view(800, 600, {-0.75, 0.1}, 3.0);
    const auto z = screen_to_world(400, 300, vs);
    EXPECT_NEAR(z.real(), -0.75, 1e-12);
    EXPECT_NEAR(z.imag(),  0.1,  1e-12);
}

TEST(ScreenToWorld, CornersSpanAspectCorrectedDomain)
{
    const ViewState vs = make_view(800, 600, {0.0, 0.0}, 4.0);
    const auto tl = screen_to_world(0, 0, vs);
    EXPECT_DOUBLE_EQ(tl.real(), -2.0);
    EXPECT_DOUBLE_EQ(tl.imag(), -1.5);   // 4 * 600/800 = 3 tall

    const auto br = screen_to_world(800, 600, vs);
    EXPECT_DOUBLE_EQ(br.real(), 2.0);
    EXPECT_DOUBLE_EQ(br.imag(), 1.5);
}

TEST(ScreenToWorld, OnePixelStepIsDomainOverWidth)
{
    const ViewState vs = make_view(1000, 500, {1.0, -1.0}, 0.5);
    const auto a = screen_to_world(10, 20, vs);
    const auto b = screen_to_world(11, 21, vs);
    EXPECT_NEAR(b.real() - a.real(), 0.5 / 1000.0, 1e-15);
    EXPECT_NEAR(b.imag() - a.imag(), 0.5 / 1000.0, 1e-15);  // square pixels
}

TEST(EscapeTime, OriginNeverEscapes)
{
    EXPECT_EQ(escape_time({0.0, 0.0}, 1), 1u);
    EXPECT_EQ(escape_time({0.0, 0.0}, 64), 64u);
    EXPECT_EQ(escape_time({0.0, 0.0}, MAX_MAX_ITER), MAX_MAX_ITER);
}

TEST(EscapeTime, TwoEscapesImmediately)
{
    EXPECT_EQ(escape_time({2.0, 0.0}, 1), 0u);
    EXPECT_EQ(escape_time({2.0, 0.0}, 1000), 0u);
    EXPECT_EQ(escape_time({0.0, -2.0}, 1000), 0u);
}

TEST(EscapeTime, KnownOrbits)
{
    // z0 = 1: 1 -> 2 (|2|^2 = 4 escapes at n = 1)
    EXPECT_EQ(escape_time({1.0, 0.0}, 100), 1u);
    // z0 = -1: -1 -> 0 -> -1 -> ... bounded
    EXPECT_EQ(escape_time({-1.0, 0.0}, 100), 100u);
    // z0 = i: i -> -1+i -> -i -> -1+i ... bounded
    EXPECT_EQ(escape_time({0.0, 1.0}, 500), 500u);
    // z0 = 0.5: 0.5 -> 0.75 -> 1.0625 -> 1.62890625 -> 3.1533... (|z|^2 >= 4 at n = 4)
    EXPECT_EQ(escape_time({0.5, 0.0}, 100), 4u);
}

TEST(EscapeTime, NonIncreasingOutsideEscapeRadius)
{
    uint32_t prev = escape_time({2.0, 0.0}, 256);
    for (double r = 2.0; r < 10.0; r += 0.25) {
        const uint32_t n = escape_time({r, 0.0}, 256);
        EXPECT_LE(n, prev);
        prev = n;
    }
    // Along the real axis just past the cusp at 0.25 escape is slower nearer it.
    EXPECT_GE(escape_time({0.26, 0.0}, 1000), escape_time({0.3, 0.0}, 1000));
    EXPECT_GE(escape_time({0.3, 0.0}, 1000),  escape_time({0.5, 0.0}, 1000));
}

TEST(EscapeTime, CappedAtMaxIter)
{
    for (uint32_t cap : {1u, 2u, 7u, 64u}) {
        EXPECT_LE(escape_time({-0.1, 0.65}, cap), cap);
        EXPECT_EQ(escape_time({-0.5, 0.0}, cap), cap);
    }
}

TEST(Palette, BrightnessTruncates)
{
    EXPECT_EQ(escape_brightness(0, 64), 0);
    EXPECT_EQ(escape_brightness(64, 64), 255);
    EXPECT_EQ(escape_brightness(1, 64), 3);     // 255/64 = 3.98
    EXPECT_EQ(escape_brightness(32, 64), 127);  // 127.5
    EXPECT_EQ(escape_brightness(1, 1), 255);
    EXPECT_EQ(escape_brightness(MAX_MAX_ITER - 1, MAX_MAX_ITER), 254);
}

TEST(Palette, GrayIsOpaqueTriple)
{
    const uint32_t p = gray_color(0x7F);
    EXPECT_EQ(p, 0xFF7F7F7Fu);
    EXPECT_EQ(pixel_red(p), 0x7F);
    EXPECT_EQ(pixel_green(p), 0x7F);
    EXPECT_EQ(pixel_blue(p), 0x7F);
    EXPECT_EQ(gray_color(0), 0xFF000000u);
    EXPECT_EQ(gray_color(255), 0xFFFFFFFFu);
}

TEST(ViewStateTest, EqualityIsStructural)
{
    ViewState a, b;
    EXPECT_EQ(a, b);
    b.center = {0.0, 1e-300};
    EXPECT_NE(a, b);
    b = a; b.width += 1;       EXPECT_NE(a, b);
    b = a; b.height += 1;      EXPECT_NE(a, b);
    b = a; b.real_domain *= 0.95; EXPECT_NE(a, b);
    b = a; b.max_iter *= 2;    EXPECT_NE(a, b);
}

TEST(ViewStateTest, ClampAndValidity)
{
    EXPECT_EQ(clamp_max_iter(0), 1u);
    EXPECT_EQ(clamp_max_iter(5), 5u);
    EXPECT_EQ(clamp_max_iter(1ull << 21), MAX_MAX_ITER);

    ViewState vs;
    EXPECT_TRUE(view_state_valid(vs));
    vs.width = 0;            EXPECT_FALSE(view_state_valid(vs));
    vs = ViewState{}; vs.max_iter = 0;           EXPECT_FALSE(view_state_valid(vs));
    vs = ViewState{}; vs.real_domain = 0.0;      EXPECT_FALSE(view_state_valid(vs));
    vs = ViewState{}; vs.max_iter = MAX_MAX_ITER + 1; EXPECT_FALSE(view_state_valid(vs));
    const double inf = std::numeric_limits<double>::infinity();
    vs = ViewState{}; vs.real_domain = inf;      EXPECT_FALSE(view_state_valid(vs));
    vs = ViewState{}; vs.center = {inf, 0.0};    EXPECT_FALSE(view_state_valid(vs));
}
