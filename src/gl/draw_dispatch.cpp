#include <vnm_flatland/gl/draw_dispatch.h>
#include <vnm_flatland/core/constants.h>

#include <glatter/glatter.h>

#include <cstring>

namespace vnm::flatland {

namespace {

bool version_at_least(GLint major, GLint minor, int want_major, int want_minor)
{
    return major > want_major || (major == want_major && minor >= want_minor);
}

bool has_extension(const char* name)
{
    GLint count = 0;
    glGetIntegerv(GL_NUM_EXTENSIONS, &count);
    for (GLint i = 0; i < count; ++i) {
        const auto* ext = reinterpret_cast<const char*>(glGetStringi(GL_EXTENSIONS, static_cast<GLuint>(i)));
        if (ext && std::strcmp(ext, name) == 0) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

gl_draw_capabilities_t query_draw_capabilities()
{
    GLint major = 0;
    GLint minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);

    gl_draw_capabilities_t caps;
    caps.multi_draw_indirect =
        version_at_least(major, minor,
            constants::k_multi_draw_indirect_major, constants::k_multi_draw_indirect_minor)
        || has_extension("GL_ARB_multi_draw_indirect");
    caps.base_instance =
        version_at_least(major, minor,
            constants::k_base_instance_major, constants::k_base_instance_minor)
        || has_extension("GL_ARB_base_instance");

    // Multi-draw-indirect commands always carry baseInstance
    if (caps.multi_draw_indirect) {
        caps.base_instance = true;
    }
    return caps;
}

std::unique_ptr<Draw_dispatch> make_draw_dispatch(const gl_draw_capabilities_t& caps, bool force_loop)
{
    if (caps.multi_draw_indirect && !force_loop) {
        return std::make_unique<Multi_draw_indirect_dispatch>();
    }
    return std::make_unique<Draw_indirect_loop_dispatch>(caps.base_instance);
}

} // namespace vnm::flatland
