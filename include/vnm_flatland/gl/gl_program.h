#pragma once

// VNM Flatland Library - GL Program
// OpenGL shader program wrapper.

#include <vnm_flatland/core/flatland_config.h>
#include <vnm_flatland/core/render_interfaces.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// Forward declare GL types to avoid including GL headers in this header
using GLuint = unsigned int;
using GLint = int;
using GLsizei = int;

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// OpenGL Initialization
// -----------------------------------------------------------------------------

/// Initialize OpenGL extension loading via glatter.
/// MUST be called once after an OpenGL context is current and before
/// create_flatlander() or any other vnm_flatland_gl function.
///
/// Returns true on success.
/// Thread-safety: Must be called from the thread with the active GL context.
[[nodiscard]] bool init_gl();

// -----------------------------------------------------------------------------
// GL_program
// -----------------------------------------------------------------------------
// A linked vertex+fragment program. Shader objects live only for the duration
// of build(); the program owns nothing else.
class GL_program : public Shader_program
{
public:
    GL_program();
    ~GL_program() override;

    // Non-copyable, movable
    GL_program(const GL_program&) = delete;
    GL_program& operator=(const GL_program&) = delete;
    GL_program(GL_program&& other) noexcept;
    GL_program& operator=(GL_program&& other) noexcept;

    // Receives compiler and linker logs
    void set_log_callback(Log_callback callback);

    // Compiles both stages and links them, replacing any previous program.
    // Returns false (and logs) on the first failing step.
    bool build(std::string_view vert_source, std::string_view frag_source);

    [[nodiscard]] GLuint program_id() const noexcept { return m_program_id; }
    [[nodiscard]] bool is_valid() const noexcept { return m_program_id != 0; }

    // --- Shader_program ---
    void set_used() override;
    [[nodiscard]] std::optional<int> get_uniform_location(const char* name) const override;
    void set_uniform_matrix_4fv(int location, const glm::mat4& matrix) override;

    void destroy();

private:
    void log_error(const std::string& message) const;

    GLuint       m_program_id = 0;
    Log_callback m_log_callback;
    mutable std::unordered_map<std::string, GLint> m_uniform_cache;
};

// -----------------------------------------------------------------------------
// Helper: Load and create a GL_program from shader sources
// -----------------------------------------------------------------------------
// Returns nullptr on failure.
[[nodiscard]]
std::unique_ptr<GL_program> create_gl_program(
    std::string_view vert_source,
    std::string_view frag_source,
    const Log_callback& log_error = nullptr);

} // namespace vnm::flatland
