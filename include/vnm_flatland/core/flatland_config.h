#pragma once

// VNM Flatland Library - Configuration
// Injectable configuration for application-specific behavior.
// Logging and profiling are provided by the host application.

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace vnm::flatland {

// Log callback for errors and diagnostics
using Log_callback = std::function<void(const std::string&)>;

// -----------------------------------------------------------------------------
// Profiling Interface (optional)
// -----------------------------------------------------------------------------
// Applications can inject profiling by implementing this interface.
// If not provided, profiling is a no-op.
class Profiler
{
public:
    virtual ~Profiler() = default;
    virtual void begin_scope(const char* name) = 0;
    virtual void end_scope() = 0;
};

// RAII scope guard for profiling
class Profile_scope
{
public:
    Profile_scope(Profiler* profiler, const char* name)
    :
        m_profiler(profiler)
    {
        if (m_profiler) {
            m_profiler->begin_scope(name);
        }
    }

    ~Profile_scope()
    {
        if (m_profiler) {
            m_profiler->end_scope();
        }
    }

    Profile_scope(const Profile_scope&) = delete;
    Profile_scope& operator=(const Profile_scope&) = delete;

private:
    Profiler* m_profiler;
};

// Macro helpers for proper __LINE__ expansion
#define VNM_FLATLAND_CONCAT_IMPL(a, b) a##b
#define VNM_FLATLAND_CONCAT(a, b) VNM_FLATLAND_CONCAT_IMPL(a, b)

// Macro for scoped profiling (no-op if profiler is null)
#define VNM_FLATLAND_PROFILE_SCOPE(profiler, name) \
    ::vnm::flatland::Profile_scope VNM_FLATLAND_CONCAT(vnm_flatland_profile_scope_, __LINE__)((profiler), (name))

// -----------------------------------------------------------------------------
// Flatland Configuration
// -----------------------------------------------------------------------------
struct Flatland_config
{
    // --- Logging (optional) ---
    // Hook for debug messages (uploads, buffer allocation).
    Log_callback log_debug;
    // Hook for errors (contract violations, shader and upload failures).
    Log_callback log_error;

    // --- Profiling (optional) ---
    std::shared_ptr<Profiler> profiler;

    // --- Shaders ---
    // Base asset name; ".vert" and ".frag" are appended.
    std::string shader_base_name = "shaders/flatland";
    // Uniform receiving the view-projection matrix. Skipped if the program
    // does not expose it.
    std::string view_projection_uniform = "ViewProjection";

    // --- Draw dispatch ---
    // When true, always draw with one indirect call per group, even if the
    // driver exposes multi-draw-indirect.
    bool force_draw_loop = false;

    // --- GPU capacity ---
    // Instance records reserved when the instance buffer is first allocated.
    std::size_t initial_instance_capacity = 256;

    static Flatland_config make_default()
    {
        Flatland_config cfg;
        cfg.shader_base_name = "shaders/flatland";
        cfg.view_projection_uniform = "ViewProjection";
        cfg.force_draw_loop = false;
        cfg.initial_instance_capacity = 256;
        return cfg;
    }
};

} // namespace vnm::flatland
