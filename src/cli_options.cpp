#include "cli_options.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static bool parse_u32(const char* s, uint32_t& out)
{
    if (!s || !*s || *s == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static bool parse_double(const char* s, double& out)
{
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// "RE,IM"
static bool parse_complex(const char* s, std::complex<double>& out)
{
    const char* comma = s ? std::strchr(s, ',') : nullptr;
    if (!comma) return false;
    const std::string re(s, comma);
    double r, i;
    if (!parse_double(re.c_str(), r) || !parse_double(comma + 1, i)) return false;
    out = {r, i};
    return true;
}

std::string parse_cli_options(int argc, const char* const argv[], AppOptions& opts)
{
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.show_help = true;
            continue;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }
        if (std::strcmp(arg, "--benchmark") == 0) {
            opts.mode = RUN_BENCHMARK;
            continue;
        }

        // Everything below takes a value.
        const bool known =
            std::strcmp(arg, "--width") == 0    || std::strcmp(arg, "--height") == 0 ||
            std::strcmp(arg, "--center") == 0   || std::strcmp(arg, "--domain") == 0 ||
            std::strcmp(arg, "--max-iter") == 0 || std::strcmp(arg, "--budget-ms") == 0 ||
            std::strcmp(arg, "--output") == 0   || std::strcmp(arg, "--render") == 0;
        if (!known)
            return std::string("Unknown option: ") + arg;
        if (i + 1 >= argc)
            return std::string("Missing value for ") + arg;
        const char* val = argv[++i];

        bool ok = true;
        if (std::strcmp(arg, "--width") == 0) {
            ok = parse_u32(val, opts.initial.width) && opts.initial.width > 0;
        } else if (std::strcmp(arg, "--height") == 0) {
            ok = parse_u32(val, opts.initial.height) && opts.initial.height > 0;
        } else if (std::strcmp(arg, "--center") == 0) {
            ok = parse_complex(val, opts.initial.center);
        } else if (std::strcmp(arg, "--domain") == 0) {
            ok = parse_double(val, opts.initial.real_domain) && opts.initial.real_domain > 0.0;
        } else if (std::strcmp(arg, "--max-iter") == 0) {
            ok = parse_u32(val, opts.initial.max_iter)
              && opts.initial.max_iter >= MIN_MAX_ITER
              && opts.initial.max_iter <= MAX_MAX_ITER;
        } else if (std::strcmp(arg, "--budget-ms") == 0) {
            ok = parse_u32(val, opts.budget_ms) && opts.budget_ms > 0;
        } else if (std::strcmp(arg, "--output") == 0) {
            opts.output_path = val;
            ok = !opts.output_path.empty();
        } else {  // --render
            opts.output_path = val;
            opts.mode        = RUN_RENDER;
            ok = !opts.output_path.empty();
        }
        if (!ok)
            return std::string("Invalid value for ") + arg + ": " + val;
    }

    if (!view_state_valid(opts.initial))
        return "Invalid initial view";
    return {};
}

void print_usage(const char* argv0)
{
    printf("brot_explorer - progressive Mandelbrot explorer\n\n"
           "Usage: %s [options]\n\n"
           "  --width N          render width in pixels (default 800)\n"
           "  --height N         render height in pixels (default 600)\n"
           "  --center RE,IM     initial center (default 0,0)\n"
           "  --domain D         initial real-axis span (default 4.0)\n"
           "  --max-iter N       initial iteration cap, 1..%u (default 64)\n"
           "  --budget-ms N      per-frame render budget (default 16)\n"
           "  --output PATH      export path for R (default out.png)\n"
           "  --render PATH      headless: render fully and export to PATH\n"
           "  --benchmark        headless: render fully, print level timings\n"
           "  --verbose          log view changes and refinement levels\n"
           "  --help             this text\n\n"
           "Keys: WASD/arrows pan, I/O zoom, E/Q double/halve iterations,\n"
           "      R export, Home reset view, F1 help, Esc quit\n",
           argv0, MAX_MAX_ITER);
}
