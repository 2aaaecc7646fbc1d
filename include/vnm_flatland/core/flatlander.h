#pragma once

// VNM Flatland Library - Flatlander
// Per-frame driver: resolves dirty channels and issues the indirect draw.

#include "buffer_stage.h"
#include "flatland.h"
#include "flatland_config.h"
#include "handles.h"
#include "render_interfaces.h"

#include <memory>
#include <optional>

#include <glm/mat4x4.hpp>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Flatlander
// -----------------------------------------------------------------------------
// Owns the shared Flatland registry and the Buffer_stage mirroring it.
// Handles created through create_alphabet() keep the registry alive on their
// own, so they may outlive the Flatlander.
//
// The collaborators are injected; create_flatlander() (gl_flatlander.h) wires
// the OpenGL implementations.
class Flatlander
{
public:
    struct collaborators_t
    {
        std::unique_ptr<Shader_program> program;
        std::unique_ptr<Render_target>  target;
        std::unique_ptr<Draw_dispatch>  dispatch;
        Buffer_stage::Backend_factory   buffer_factory;
    };

    Flatlander(collaborators_t collaborators, Flatland_config config);
    ~Flatlander();

    Flatlander(const Flatlander&) = delete;
    Flatlander& operator=(const Flatlander&) = delete;

    // Flip drawing on/off. No other side effects.
    void toggle() noexcept { m_draw_enabled = !m_draw_enabled; }
    // Flip wireframe (line polygon mode) on/off. No other side effects.
    void toggle_wireframe() noexcept { m_wireframe = !m_wireframe; }

    [[nodiscard]] bool draw_enabled() const noexcept { return m_draw_enabled; }
    [[nodiscard]] bool wireframe() const noexcept { return m_wireframe; }

    [[nodiscard]] Alphabet create_alphabet();

    // Resolves pending uploads and draws every live group.
    // No-op while drawing is disabled, before any geometry was uploaded, or
    // while an upload failed this frame.
    void render(const glm::mat4& view_projection);

    [[nodiscard]] const std::shared_ptr<Flatland>& flatland() const noexcept { return m_flatland; }
    [[nodiscard]] const Buffer_stage& stage() const noexcept { return m_stage; }

private:
    Flatland_config                 m_config;
    std::unique_ptr<Shader_program> m_program;
    std::unique_ptr<Render_target>  m_target;
    std::unique_ptr<Draw_dispatch>  m_dispatch;
    std::optional<int>              m_view_projection_location;
    std::shared_ptr<Flatland>       m_flatland;
    Buffer_stage                    m_stage;
    bool                            m_draw_enabled = true;
    bool                            m_wireframe    = false;
};

} // namespace vnm::flatland
