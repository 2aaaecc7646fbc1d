#pragma once

// VNM Flatland Library - Asset Loader
// Shader source loading with embedded defaults and optional file overrides.

#include "flatland_config.h"
#include "types.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Asset_loader
// -----------------------------------------------------------------------------
// Name -> text lookup. A file under the override directory shadows the
// embedded copy of the same name, which lets shaders be edited without a
// rebuild.
class Asset_loader
{
public:
    Asset_loader();
    ~Asset_loader();

    void set_log_callback(Log_callback callback);

    // Empty disables overrides.
    void set_override_directory(std::string_view path);
    [[nodiscard]] std::string_view override_directory() const noexcept;

    // `data` is referenced, not copied.
    void register_embedded(std::string_view name, std::string_view data);

    [[nodiscard]] std::optional<ByteBuffer> load(std::string_view name) const;
    [[nodiscard]] bool exists(std::string_view name) const;

    struct Shader_sources
    {
        ByteBuffer vertex;
        ByteBuffer fragment;
    };

    // Loads `<base_name>.vert` and `<base_name>.frag`; nullopt unless both exist.
    [[nodiscard]] std::optional<Shader_sources> load_shader(std::string_view base_name) const;

private:
    // Full path of `name` in the override directory, if that file exists.
    std::optional<std::string> override_path(std::string_view name) const;
    void log_error(const std::string& message) const;

    Log_callback m_log_callback;
    std::string  m_override_dir;
    std::unordered_map<std::string, std::string_view> m_embedded;
};

// -----------------------------------------------------------------------------
// Default Asset Registry
// -----------------------------------------------------------------------------

// Global loader with the embedded assets registered on first access.
[[nodiscard]] Asset_loader& default_asset_loader();

// Registers the embedded assets into `loader`.
// Defined in the generated embedded_assets.cpp.
void init_embedded_assets(Asset_loader& loader);

} // namespace vnm::flatland
