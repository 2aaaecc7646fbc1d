#pragma once

// VNM Flatland Library - GL Render Target
// Blend, winding and polygon mode state around the flatland draw.

#include <vnm_flatland/core/render_interfaces.h>

namespace vnm::flatland {

class GL_render_target final : public Render_target
{
public:
    void set_default_blend_func() override;
    void front_face_cw() override;
    void front_face_ccw() override;
    void polygon_mode_line() override;
    void polygon_mode_fill() override;
};

} // namespace vnm::flatland
