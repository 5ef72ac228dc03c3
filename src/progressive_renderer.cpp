#include "progressive_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

// Calls spent on one level: every row paints width/bs + 1 blocks and then
// wraps, height/bs + 1 rows are scanned, and one more call halves.
static uint64_t level_calls(uint32_t bs, uint32_t width, uint32_t height)
{
    const uint64_t cols = width  / bs + 1;
    const uint64_t rows = height / bs + 1;
    return rows * (cols + 1) + 1;
}

RenderStep next_step(const RenderProgress& p, uint32_t width, uint32_t height)
{
    if (p.phase == RenderPhase::Done)
        return RenderStep::Idle;

    const uint64_t tl_x = static_cast<uint64_t>(p.index_x) * p.block_size;
    const uint64_t tl_y = static_cast<uint64_t>(p.index_y) * p.block_size;

    if (tl_x > width)
        return RenderStep::RowWrap;
    if (tl_y > height)
        return RenderStep::Halve;
    if (p.block_size < 1)
        return RenderStep::Finish;
    return RenderStep::Paint;
}

RenderStep advance(PixelBuffer& buf, const ViewState& vs, RenderProgress& p)
{
    const RenderStep step = next_step(p, vs.width, vs.height);
    switch (step) {
        case RenderStep::Idle:
            break;
        case RenderStep::RowWrap:
            p.index_x = 0;
            p.index_y += 1;
            break;
        case RenderStep::Halve:
            p.index_y = 0;
            p.block_size /= 2;
            break;
        case RenderStep::Finish:
            p.phase = RenderPhase::Done;
            break;
        case RenderStep::Paint: {
            const uint32_t bs   = p.block_size;
            const uint32_t tl_x = p.index_x * bs;
            const uint32_t tl_y = p.index_y * bs;

            const auto     z0 = screen_to_world(tl_x + bs / 2, tl_y + bs / 2, vs);
            const uint32_t n  = escape_time(z0, vs.max_iter);
            buf.fill_rect(tl_x, tl_y, bs, bs, gray_color(escape_brightness(n, vs.max_iter)));

            p.index_x += 1;
            break;
        }
    }
    return step;
}

uint64_t drain(PixelBuffer& buf, const ViewState& vs, RenderProgress& p)
{
    uint64_t calls = 0;
    while (!p.done()) {
        advance(buf, vs, p);
        ++calls;
    }
    return calls;
}

uint64_t advance_calls_to_completion(uint32_t width, uint32_t height)
{
    uint64_t total = 0;
    for (uint32_t bs = INITIAL_BLOCK_SIZE; bs >= 1; bs /= 2)
        total += level_calls(bs, width, height);
    return total + 1;  // Finish
}

double render_progress_fraction(const RenderProgress& p, uint32_t width, uint32_t height)
{
    const uint64_t total = advance_calls_to_completion(width, height);
    if (p.done())
        return 1.0;
    if (p.block_size == 0)
        return static_cast<double>(total - 1) / static_cast<double>(total);

    uint64_t spent = 0;
    for (uint32_t bs = INITIAL_BLOCK_SIZE; bs > p.block_size; bs /= 2)
        spent += level_calls(bs, width, height);

    const uint64_t cols = width / p.block_size + 1;
    spent += static_cast<uint64_t>(p.index_y) * (cols + 1) + p.index_x;
    return static_cast<double>(spent) / static_cast<double>(total);
}
