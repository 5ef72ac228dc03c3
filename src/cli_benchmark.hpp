#pragma once

#include "cli_options.hpp"
#include "export.hpp"
#include "progressive_renderer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

// Drains one full progressive render RUNS times and prints, per refinement
// level, the average of the BEST_N fastest passes.
inline int run_cli_benchmark(const AppOptions& opts)
{
    using clock = std::chrono::steady_clock;
    constexpr int RUNS = 4, BEST_N = 2;

    const ViewState& vs = opts.initial;
    PixelBuffer buf;
    buf.resize(vs.width, vs.height);

    int levels = 0;
    for (uint32_t bs = INITIAL_BLOCK_SIZE; bs >= 1; bs /= 2) ++levels;

    // times[level][run]
    std::vector<std::vector<double>> times(levels, std::vector<double>(RUNS, 0.0));
    std::vector<uint64_t> paints(levels, 0);
    uint64_t calls = 0;

    for (int r = 0; r < RUNS; ++r) {
        RenderProgress p;
        calls = 0;
        int  level = 0;
        auto t0    = clock::now();
        while (!p.done()) {
            const RenderStep step = advance(buf, vs, p);
            ++calls;
            if (step == RenderStep::Paint && r == 0)
                ++paints[level];
            if (step == RenderStep::Halve) {
                const auto t1 = clock::now();
                times[level][r] = std::chrono::duration<double, std::milli>(t1 - t0).count();
                t0 = t1;
                ++level;
            }
        }
    }

    printf("Progressive render benchmark\n");
    printf("%ux%u, center (%.6g, %.6g), domain %.6g, %u iter, %d runs (avg best %d)\n\n",
           vs.width, vs.height, vs.center.real(), vs.center.imag(),
           vs.real_domain, vs.max_iter, RUNS, BEST_N);
    printf("%-8s %-10s %-10s %s\n", "Block", "Blocks", "ms", "Mblocks/s");
    printf("------------------------------------------\n");

    double total_ms = 0.0;
    uint32_t bs = INITIAL_BLOCK_SIZE;
    for (int l = 0; l < levels; ++l, bs /= 2) {
        std::vector<double> t = times[l];
        std::sort(t.begin(), t.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += t[i];
        avg_ms /= BEST_N;
        total_ms += avg_ms;
        const double mblocks = avg_ms > 0.0 ? paints[l] / (avg_ms * 1000.0) : 0.0;
        printf("%-8u %-10llu %-10.2f %.2f\n", bs,
               static_cast<unsigned long long>(paints[l]), avg_ms, mblocks);
    }
    printf("------------------------------------------\n");
    printf("total %.2f ms, %llu advance calls (expected %llu)\n", total_ms,
           static_cast<unsigned long long>(calls),
           static_cast<unsigned long long>(advance_calls_to_completion(vs.width, vs.height)));
    return 0;
}

// Drains one full render and exports it to opts.output_path.
inline int run_cli_render(const AppOptions& opts)
{
    PixelBuffer buf;
    buf.resize(opts.initial.width, opts.initial.height);
    RenderProgress p;
    const uint64_t calls = drain(buf, opts.initial, p);
    if (opts.verbose)
        fprintf(stderr, "rendered %ux%u in %llu advance calls\n",
                buf.width, buf.height, static_cast<unsigned long long>(calls));

    const std::string err = export_image(opts.output_path, buf);
    if (!err.empty()) {
        fprintf(stderr, "Export failed: %s\n", err.c_str());
        return 1;
    }
    printf("Saved: %s\n", opts.output_path.c_str());
    return 0;
}
