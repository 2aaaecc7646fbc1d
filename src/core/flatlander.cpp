#include <vnm_flatland/core/flatlander.h>

#include <utility>

namespace vnm::flatland {

namespace {

bool dispatch_uses_base_instance(const std::unique_ptr<Draw_dispatch>& dispatch)
{
    return dispatch ? dispatch->uses_base_instance() : true;
}

} // anonymous namespace

Flatlander::Flatlander(collaborators_t collaborators, Flatland_config config)
    : m_config(std::move(config))
    , m_program(std::move(collaborators.program))
    , m_target(std::move(collaborators.target))
    , m_dispatch(std::move(collaborators.dispatch))
    , m_flatland(std::make_shared<Flatland>())
    , m_stage(std::move(collaborators.buffer_factory), dispatch_uses_base_instance(m_dispatch))
{
    m_flatland->set_log_callback(m_config.log_error);
    m_stage.set_log_callbacks(m_config.log_debug, m_config.log_error);
    m_stage.set_profiler(m_config.profiler.get());

    if (m_program) {
        m_view_projection_location =
            m_program->get_uniform_location(m_config.view_projection_uniform.c_str());
    }
}

Flatlander::~Flatlander() = default;

Alphabet Flatlander::create_alphabet()
{
    return vnm::flatland::create_alphabet(m_flatland);
}

void Flatlander::render(const glm::mat4& view_projection)
{
    if (!m_draw_enabled) {
        return;
    }

    VNM_FLATLAND_PROFILE_SCOPE(m_config.profiler.get(), "flatland.render");

    m_stage.resolve(*m_flatland);

    if (!m_stage.has_buffers() || !m_program || !m_target || !m_dispatch) {
        return;
    }

    // A failed upload leaves the GPU buffers out of step with the uploaded
    // commands; draw again once a resolve completes.
    if (m_flatland->alphabets_invalidated()
        || m_flatland->groups_invalidated()
        || m_flatland->draw_invalidated())
    {
        return;
    }

    m_program->set_used();
    if (m_view_projection_location) {
        m_program->set_uniform_matrix_4fv(*m_view_projection_location, view_projection);
    }

    m_stage.bind();

    m_target->set_default_blend_func();
    m_target->front_face_cw();
    if (m_wireframe) {
        m_target->polygon_mode_line();
    }

    m_dispatch->draw(m_stage);

    if (m_wireframe) {
        m_target->polygon_mode_fill();
    }
    m_target->front_face_ccw();

    m_stage.unbind();
}

} // namespace vnm::flatland
