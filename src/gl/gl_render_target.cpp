#include <vnm_flatland/gl/gl_render_target.h>

#include <glatter/glatter.h>

namespace vnm::flatland {

void GL_render_target::set_default_blend_func()
{
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}

void GL_render_target::front_face_cw()
{
    glFrontFace(GL_CW);
}

void GL_render_target::front_face_ccw()
{
    glFrontFace(GL_CCW);
}

void GL_render_target::polygon_mode_line()
{
    glPolygonMode(GL_FRONT_AND_BACK, GL_LINE);
}

void GL_render_target::polygon_mode_fill()
{
    glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
}

} // namespace vnm::flatland
