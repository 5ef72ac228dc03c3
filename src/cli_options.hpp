#pragma once

#include "view_state.hpp"

#include <cstdint>
#include <string>

enum RunMode {
    RUN_INTERACTIVE = 0,
    RUN_BENCHMARK   = 1,  // headless: drain one render, print per-level timings
    RUN_RENDER      = 2,  // headless: drain one render, export it
};

struct AppOptions {
    ViewState   initial;                  // 800x600, center 0, domain 4, 64 iter
    uint32_t    budget_ms   = 16;
    std::string output_path = "out.png";
    RunMode     mode        = RUN_INTERACTIVE;
    bool        verbose     = false;
    bool        show_help   = false;
};

// Fills `opts` from argv. Returns empty string on success, or an error
// message naming the offending argument.
std::string parse_cli_options(int argc, const char* const argv[], AppOptions& opts);

void print_usage(const char* argv0);
