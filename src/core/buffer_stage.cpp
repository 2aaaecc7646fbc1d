#include <vnm_flatland/core/buffer_stage.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace vnm::flatland {

Buffer_stage::Buffer_stage(Backend_factory factory, bool use_base_instance)
    : m_factory(std::move(factory))
    , m_use_base_instance(use_base_instance)
{
}

Buffer_stage::~Buffer_stage() = default;

void Buffer_stage::set_log_callbacks(Log_callback log_debug, Log_callback log_error)
{
    m_log_debug = std::move(log_debug);
    m_log_error = std::move(log_error);
}

void Buffer_stage::log_debug(const std::string& message) const
{
    if (m_log_debug) {
        m_log_debug(message);
    }
}

void Buffer_stage::log_error(const std::string& message) const
{
    if (m_log_error) {
        m_log_error(message);
    }
}

Buffer_stage::resolve_result_t Buffer_stage::resolve(Flatland& flatland)
{
    VNM_FLATLAND_PROFILE_SCOPE(m_profiler, "flatland.resolve");

    resolve_result_t result;

    if (flatland.alphabets_invalidated()) {
        result.geometry = resolve_geometry(flatland);
    }

    // Group channels reference geometry offsets and need the buffers to exist.
    if (!m_buffers || flatland.alphabets_invalidated()) {
        return result;
    }

    if (flatland.groups_invalidated()) {
        result.instances = resolve_instances(flatland);
    }

    // Commands are built from the spans recorded by the last instance upload.
    if (flatland.groups_invalidated()) {
        return result;
    }

    if (flatland.draw_invalidated()) {
        result.commands = resolve_commands(flatland);
    }

    return result;
}

bool Buffer_stage::resolve_geometry(Flatland& flatland)
{
    if (!m_buffers) {
        if (!m_factory) {
            log_error("Buffer_stage: no buffer factory");
            return false;
        }
        m_buffers = m_factory();
        if (!m_buffers) {
            log_error("Buffer_stage: failed to allocate GPU buffers");
            return false;
        }
        ++m_stats.allocations;
        log_debug("Buffer_stage: allocated GPU buffers");
    }

    std::vector<vertex_t> vertices;
    std::vector<index_t> indices;
    std::vector<alphabet_base_t> bases;

    flatland.alphabets().for_each([&](slot_id_t slot, const alphabet_t& alphabet) {
        if (bases.size() <= slot.index) {
            bases.resize(slot.index + 1);
        }
        alphabet_base_t& base = bases[slot.index];
        base.present     = true;
        base.generation  = slot.generation;
        base.vertex_base = static_cast<std::uint32_t>(vertices.size());
        base.index_base  = static_cast<std::uint32_t>(indices.size());

        vertices.insert(vertices.end(), alphabet.vertices.begin(), alphabet.vertices.end());
        indices.insert(indices.end(), alphabet.indices.begin(), alphabet.indices.end());
    });

    if (!m_buffers->upload_vertices(vertices) || !m_buffers->upload_indices(indices)) {
        ++m_stats.failed_uploads;
        log_error("Buffer_stage: geometry upload failed ("
            + std::to_string(vertices.size()) + " vertices, "
            + std::to_string(indices.size()) + " indices)");
        return false;
    }

    ++m_stats.geometry_uploads;
    m_alphabet_bases = std::move(bases);
    m_vertex_count = vertices.size();
    m_index_count = indices.size();

    flatland.clear_alphabets_invalidated();
    flatland.invalidate_groups();

    log_debug("Buffer_stage: uploaded " + std::to_string(m_vertex_count) + " vertices, "
        + std::to_string(m_index_count) + " indices");
    return true;
}

bool Buffer_stage::resolve_instances(Flatland& flatland)
{
    std::vector<item_instance_t> instances;
    std::vector<group_span_t> spans;
    std::size_t skipped_items = 0;

    const Alphabet_registry& alphabets = flatland.alphabets();

    flatland.groups().for_each([&](slot_id_t slot, const group_t& group) {
        if (spans.size() <= slot.index) {
            spans.resize(slot.index + 1);
        }
        group_span_t& span = spans[slot.index];
        span.present        = true;
        span.generation     = slot.generation;
        span.first_instance = static_cast<std::uint32_t>(instances.size());

        const alphabet_t* alphabet = alphabets.find(group.alphabet);
        const alphabet_base_t* base = find_alphabet_base(group.alphabet);
        if (!alphabet || !base) {
            skipped_items += group.items.size();
            return;
        }

        span.base_vertex = static_cast<std::int32_t>(base->vertex_base);

        std::uint32_t index_begin = std::numeric_limits<std::uint32_t>::max();
        std::uint32_t index_end   = 0;

        for (const Flatland_item& item : group.items) {
            if (item.alphabet_entry_index >= alphabet->entries.size()) {
                ++skipped_items;
                continue;
            }
            const entry_range_t& range = alphabet->entries[item.alphabet_entry_index].range;

            item_instance_t instance;
            instance.transform    = group.transform;
            instance.color        = group.color;
            instance.offset       = glm::vec2(static_cast<float>(item.x_offset), static_cast<float>(item.y_offset));
            instance.vertex_range = glm::uvec2(base->vertex_base + range.vertex_offset, range.vertex_count);
            instances.push_back(instance);
            ++span.instance_count;

            if (range.index_count > 0) {
                index_begin = std::min(index_begin, base->index_base + range.index_offset);
                index_end   = std::max(index_end, base->index_base + range.index_offset + range.index_count);
            }
        }

        if (index_end > 0) {
            span.first_index = index_begin;
            span.index_count = index_end - index_begin;
        }
    });

    if (skipped_items > 0) {
        log_debug("Buffer_stage: skipped " + std::to_string(skipped_items)
            + " items with unknown alphabet entries");
    }

    if (!m_buffers->upload_instances(instances)) {
        ++m_stats.failed_uploads;
        log_error("Buffer_stage: instance upload failed (" + std::to_string(instances.size()) + " records)");
        return false;
    }

    ++m_stats.instance_uploads;
    m_instances = std::move(instances);
    m_group_spans = std::move(spans);
    flatland.clear_groups_invalidated();
    return true;
}

bool Buffer_stage::resolve_commands(Flatland& flatland)
{
    std::vector<draw_indirect_cmd_t> commands;
    std::vector<std::uint32_t> first_instances;
    commands.reserve(flatland.groups().size());
    first_instances.reserve(flatland.groups().size());

    flatland.groups().for_each([&](slot_id_t slot, const group_t&) {
        draw_indirect_cmd_t cmd;
        std::uint32_t first_instance = 0;

        if (const group_span_t* span = find_group_span(slot)) {
            cmd.count          = span->index_count;
            cmd.instance_count = span->index_count > 0 ? span->instance_count : 0;
            cmd.first_index    = span->first_index;
            cmd.base_vertex    = span->base_vertex;
            first_instance     = span->first_instance;
        }
        cmd.base_instance = m_use_base_instance ? first_instance : 0;

        commands.push_back(cmd);
        first_instances.push_back(first_instance);
    });

    if (!m_buffers->upload_draw_commands(commands)) {
        ++m_stats.failed_uploads;
        log_error("Buffer_stage: draw command upload failed (" + std::to_string(commands.size()) + " commands)");
        return false;
    }

    ++m_stats.command_uploads;
    m_commands = std::move(commands);
    m_command_first_instances = std::move(first_instances);
    flatland.clear_draw_invalidated();
    return true;
}

const Buffer_stage::alphabet_base_t* Buffer_stage::find_alphabet_base(slot_id_t slot) const
{
    if (slot.index >= m_alphabet_bases.size()) {
        return nullptr;
    }
    const alphabet_base_t& base = m_alphabet_bases[slot.index];
    if (!base.present || base.generation != slot.generation) {
        return nullptr;
    }
    return &base;
}

const Buffer_stage::group_span_t* Buffer_stage::find_group_span(slot_id_t slot) const
{
    if (slot.index >= m_group_spans.size()) {
        return nullptr;
    }
    const group_span_t& span = m_group_spans[slot.index];
    if (!span.present || span.generation != slot.generation) {
        return nullptr;
    }
    return &span;
}

void Buffer_stage::bind()
{
    if (m_buffers) {
        m_buffers->bind();
    }
}

void Buffer_stage::unbind()
{
    if (m_buffers) {
        m_buffers->unbind();
    }
}

} // namespace vnm::flatland
