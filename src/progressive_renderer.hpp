#pragma once

#include "renderer.hpp"
#include "view_state.hpp"

#include <cstdint>

constexpr uint32_t INITIAL_BLOCK_SIZE = 128;

enum class RenderPhase {
    Scanning,  // painting blocks of block_size, row by row
    Done,      // absorbing: every level down to 1 px has been painted
};

// Transition performed by a single advance() call.
enum class RenderStep {
    Paint,     // filled one block, index_x += 1
    RowWrap,   // row exhausted: index_x = 0, index_y += 1
    Halve,     // grid exhausted: index_y = 0, block_size /= 2
    Finish,    // block_size reached 0: phase becomes Done
    Idle,      // already Done, nothing to do
};

// Resumable coarse-to-fine traversal of the block grid. index_x/index_y are
// in block units, not pixels.
struct RenderProgress {
    RenderPhase phase      = RenderPhase::Scanning;
    uint32_t    index_x    = 0;
    uint32_t    index_y    = 0;
    uint32_t    block_size = INITIAL_BLOCK_SIZE;

    bool done() const { return phase == RenderPhase::Done; }
};

inline bool operator==(const RenderProgress& a, const RenderProgress& b)
{
    return a.phase == b.phase && a.index_x == b.index_x
        && a.index_y == b.index_y && a.block_size == b.block_size;
}

inline bool operator!=(const RenderProgress& a, const RenderProgress& b)
{
    return !(a == b);
}

// Decides what the next advance() on this state will do. The edge tests are
// strict (>), so a block whose top-left corner sits exactly on the right or
// bottom edge is still painted.
RenderStep next_step(const RenderProgress& p, uint32_t width, uint32_t height);

// Performs exactly one transition. A Paint samples the complex point at the
// block center, maps its escape time to gray and fills the whole block.
// `buf` must have the dimensions of `vs`.
RenderStep advance(PixelBuffer& buf, const ViewState& vs, RenderProgress& p);

// Runs advance() until done; returns the number of calls made.
uint64_t drain(PixelBuffer& buf, const ViewState& vs, RenderProgress& p);

// Number of advance() calls from the initial state to done (the final
// Finish call included) for a width x height target.
uint64_t advance_calls_to_completion(uint32_t width, uint32_t height);

// Share of advance_calls_to_completion() already performed by `p`, in [0, 1].
double render_progress_fraction(const RenderProgress& p, uint32_t width, uint32_t height);
