#pragma once

// VNM Flatland Library - Draw Dispatch
// The two indirect draw strategies behind Draw_dispatch.

#include "render_interfaces.h"

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Multi_draw_indirect_dispatch
// -----------------------------------------------------------------------------
// One multi-draw call covering every command.
class Multi_draw_indirect_dispatch final : public Draw_dispatch
{
public:
    [[nodiscard]] bool uses_base_instance() const noexcept override { return true; }
    void draw(Buffer_stage& stage) override;
};

// -----------------------------------------------------------------------------
// Draw_indirect_loop_dispatch
// -----------------------------------------------------------------------------
// One indirect draw per command, in command order, skipping commands with no
// instances. Without base instance support, the instance attributes are
// re-pointed at each group's first record before its draw and reset to
// record 0 afterwards.
class Draw_indirect_loop_dispatch final : public Draw_dispatch
{
public:
    explicit Draw_indirect_loop_dispatch(bool base_instance)
        : m_base_instance(base_instance)
    {
    }

    [[nodiscard]] bool uses_base_instance() const noexcept override { return m_base_instance; }
    void draw(Buffer_stage& stage) override;

private:
    bool m_base_instance = false;
};

} // namespace vnm::flatland
