#pragma once

// VNM Flatland Library - Draw Capabilities
// Capability query choosing between the indirect draw strategies.

#include <vnm_flatland/core/draw_dispatch.h>
#include <vnm_flatland/core/render_interfaces.h>

#include <memory>

namespace vnm::flatland {

struct gl_draw_capabilities_t
{
    // glMultiDrawElementsIndirect (GL 4.3 or GL_ARB_multi_draw_indirect)
    bool multi_draw_indirect = false;
    // baseInstance honored in indirect commands (GL 4.2 or GL_ARB_base_instance)
    bool base_instance = false;
};

// Queries the current context. Requires init_gl().
[[nodiscard]] gl_draw_capabilities_t query_draw_capabilities();

// Picks the strategy for `caps`. `force_loop` selects the per-command path
// even when multi-draw is available.
[[nodiscard]] std::unique_ptr<Draw_dispatch> make_draw_dispatch(
    const gl_draw_capabilities_t& caps,
    bool force_loop);

} // namespace vnm::flatland
