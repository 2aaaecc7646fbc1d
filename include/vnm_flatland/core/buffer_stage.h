#pragma once

// VNM Flatland Library - Buffer Stage
// Mirrors the Flatland registry into GPU buffers, one dirty channel at a time.

#include "flatland.h"
#include "flatland_config.h"
#include "render_interfaces.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Buffer_stage
// -----------------------------------------------------------------------------
// Channels are resolved in a fixed order, each only when its dirty flag is set:
//
//   1. geometry  - all live alphabets' vertices and indices, concatenated in
//                  slot order. Allocates the GPU buffers on first use. Moving
//                  geometry invalidates both group channels.
//   2. instances - one item_instance_t per valid item, grouped by group in
//                  slot order. Requires buffers and clean geometry.
//   3. commands  - one draw_indirect_cmd_t per live group in slot order.
//                  Requires buffers and clean instances.
//
// A channel clears its flag only after a successful upload; a skipped or
// failed channel keeps its flag and is retried by the next resolve.
class Buffer_stage
{
public:
    using Backend_factory = std::function<std::unique_ptr<Gpu_buffer_backend>()>;

    struct resolve_result_t
    {
        bool geometry  = false;
        bool instances = false;
        bool commands  = false;

        [[nodiscard]] bool any() const noexcept { return geometry || instances || commands; }
    };

    struct upload_stats_t
    {
        std::uint64_t allocations      = 0;
        std::uint64_t geometry_uploads = 0;
        std::uint64_t instance_uploads = 0;
        std::uint64_t command_uploads  = 0;
        std::uint64_t failed_uploads   = 0;
    };

    Buffer_stage(Backend_factory factory, bool use_base_instance);
    ~Buffer_stage();

    Buffer_stage(const Buffer_stage&) = delete;
    Buffer_stage& operator=(const Buffer_stage&) = delete;

    void set_log_callbacks(Log_callback log_debug, Log_callback log_error);
    void set_profiler(Profiler* profiler) { m_profiler = profiler; }

    // Uploads every dirty channel of `flatland` (see class comment).
    resolve_result_t resolve(Flatland& flatland);

    [[nodiscard]] bool has_buffers() const noexcept { return static_cast<bool>(m_buffers); }
    [[nodiscard]] Gpu_buffer_backend* buffers() noexcept { return m_buffers.get(); }

    void bind();
    void unbind();

    // CPU copies of the last successful uploads.
    [[nodiscard]] std::size_t command_count() const noexcept { return m_commands.size(); }
    [[nodiscard]] const std::vector<draw_indirect_cmd_t>& commands() const noexcept { return m_commands; }
    [[nodiscard]] const std::vector<std::uint32_t>& command_first_instances() const noexcept
    {
        return m_command_first_instances;
    }
    [[nodiscard]] const std::vector<item_instance_t>& instances() const noexcept { return m_instances; }
    [[nodiscard]] std::size_t vertex_count() const noexcept { return m_vertex_count; }
    [[nodiscard]] std::size_t index_count() const noexcept { return m_index_count; }

    [[nodiscard]] const upload_stats_t& upload_stats() const noexcept { return m_stats; }
    [[nodiscard]] bool uses_base_instance() const noexcept { return m_use_base_instance; }

private:
    // Where an alphabet's region starts in the shared vertex/index buffers.
    struct alphabet_base_t
    {
        bool          present      = false;
        std::uint32_t generation   = 0;
        std::uint32_t vertex_base  = 0;
        std::uint32_t index_base   = 0;
    };

    // What a group's command covers, recorded when instances are packed.
    struct group_span_t
    {
        bool          present        = false;
        std::uint32_t generation     = 0;
        std::uint32_t first_instance = 0;
        std::uint32_t instance_count = 0;
        std::uint32_t first_index    = 0;
        std::uint32_t index_count    = 0;
        std::int32_t  base_vertex    = 0;
    };

    bool resolve_geometry(Flatland& flatland);
    bool resolve_instances(Flatland& flatland);
    bool resolve_commands(Flatland& flatland);

    const alphabet_base_t* find_alphabet_base(slot_id_t slot) const;
    const group_span_t* find_group_span(slot_id_t slot) const;

    void log_debug(const std::string& message) const;
    void log_error(const std::string& message) const;

    Backend_factory                     m_factory;
    std::unique_ptr<Gpu_buffer_backend> m_buffers;
    bool                                m_use_base_instance = true;

    std::vector<alphabet_base_t>     m_alphabet_bases;
    std::vector<group_span_t>        m_group_spans;
    std::vector<item_instance_t>     m_instances;
    std::vector<draw_indirect_cmd_t> m_commands;
    std::vector<std::uint32_t>       m_command_first_instances;
    std::size_t                      m_vertex_count = 0;
    std::size_t                      m_index_count  = 0;

    upload_stats_t m_stats;
    Profiler*      m_profiler = nullptr;
    Log_callback   m_log_debug;
    Log_callback   m_log_error;
};

} // namespace vnm::flatland
