#include <vnm_flatland/gl/gl_program.h>

#include <glatter/glatter.h>
#include <glm/gtc/type_ptr.hpp>

#include <atomic>
#include <memory>
#include <utility>

namespace vnm::flatland {

namespace {

std::atomic<bool> g_gl_initialized{false};

const char* stage_name(GLenum stage)
{
    return stage == GL_VERTEX_SHADER ? "vertex" : "fragment";
}

std::string shader_info_log(GLuint shader)
{
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    std::string log(static_cast<std::size_t>(length > 0 ? length : 0), '\0');
    if (length > 0) {
        glGetShaderInfoLog(shader, length, nullptr, log.data());
    }
    return log;
}

std::string program_info_log(GLuint program)
{
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    std::string log(static_cast<std::size_t>(length > 0 ? length : 0), '\0');
    if (length > 0) {
        glGetProgramInfoLog(program, length, nullptr, log.data());
    }
    return log;
}

// Returns the compiled shader object, or 0 with `error` filled in.
GLuint compile_stage(GLenum stage, std::string_view source, std::string& error)
{
    const GLuint shader = glCreateShader(stage);
    if (shader == 0) {
        error = std::string("cannot create ") + stage_name(stage) + " shader object";
        return 0;
    }

    const char* text = source.data();
    const GLint length = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &text, &length);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status == GL_FALSE) {
        error = std::string(stage_name(stage)) + " shader failed to compile: " + shader_info_log(shader);
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

} // anonymous namespace

bool init_gl()
{
    if (g_gl_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    // Resolves glatter's entry points for the current context
    (void)glatter_get_extension_support_GL();

    g_gl_initialized.store(true, std::memory_order_release);
    return true;
}

GL_program::GL_program() = default;

GL_program::~GL_program()
{
    destroy();
}

GL_program::GL_program(GL_program&& other) noexcept
    : m_program_id(std::exchange(other.m_program_id, 0))
    , m_log_callback(std::move(other.m_log_callback))
    , m_uniform_cache(std::move(other.m_uniform_cache))
{
}

GL_program& GL_program::operator=(GL_program&& other) noexcept
{
    if (this != &other) {
        destroy();
        m_program_id = std::exchange(other.m_program_id, 0);
        m_log_callback = std::move(other.m_log_callback);
        m_uniform_cache = std::move(other.m_uniform_cache);
    }
    return *this;
}

void GL_program::set_log_callback(Log_callback callback)
{
    m_log_callback = std::move(callback);
}

void GL_program::log_error(const std::string& message) const
{
    if (m_log_callback) {
        m_log_callback(message);
    }
}

bool GL_program::build(std::string_view vert_source, std::string_view frag_source)
{
    destroy();

    std::string error;
    const GLuint vert = compile_stage(GL_VERTEX_SHADER, vert_source, error);
    if (vert == 0) {
        log_error("GL_program: " + error);
        return false;
    }

    const GLuint frag = compile_stage(GL_FRAGMENT_SHADER, frag_source, error);
    if (frag == 0) {
        glDeleteShader(vert);
        log_error("GL_program: " + error);
        return false;
    }

    const GLuint program = glCreateProgram();
    if (program == 0) {
        glDeleteShader(vert);
        glDeleteShader(frag);
        log_error("GL_program: cannot create program object");
        return false;
    }

    glAttachShader(program, vert);
    glAttachShader(program, frag);
    glLinkProgram(program);

    // Stages are not needed once the link attempt is over
    glDetachShader(program, vert);
    glDetachShader(program, frag);
    glDeleteShader(vert);
    glDeleteShader(frag);

    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    if (status == GL_FALSE) {
        log_error("GL_program: link failed: " + program_info_log(program));
        glDeleteProgram(program);
        return false;
    }

    m_program_id = program;
    return true;
}

void GL_program::set_used()
{
    if (m_program_id != 0) {
        glUseProgram(m_program_id);
    }
}

std::optional<int> GL_program::get_uniform_location(const char* name) const
{
    if (m_program_id == 0 || !name) {
        return std::nullopt;
    }

    auto it = m_uniform_cache.find(name);
    if (it == m_uniform_cache.end()) {
        it = m_uniform_cache.emplace(name, glGetUniformLocation(m_program_id, name)).first;
    }

    if (it->second < 0) {
        return std::nullopt;
    }
    return it->second;
}

void GL_program::set_uniform_matrix_4fv(int location, const glm::mat4& matrix)
{
    glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(matrix));
}

void GL_program::destroy()
{
    if (m_program_id != 0) {
        glDeleteProgram(m_program_id);
        m_program_id = 0;
    }
    m_uniform_cache.clear();
}

std::unique_ptr<GL_program> create_gl_program(
    std::string_view vert_source,
    std::string_view frag_source,
    const Log_callback& log_error)
{
    auto program = std::make_unique<GL_program>();
    program->set_log_callback(log_error);
    if (!program->build(vert_source, frag_source)) {
        return nullptr;
    }
    return program;
}

} // namespace vnm::flatland
