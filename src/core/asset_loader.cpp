#include <vnm_flatland/core/asset_loader.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <utility>

namespace vnm::flatland {

namespace {

namespace fs = std::filesystem;

std::optional<ByteBuffer> read_whole_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    ByteBuffer contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::nullopt;
    }
    return contents;
}

} // anonymous namespace

Asset_loader::Asset_loader() = default;
Asset_loader::~Asset_loader() = default;

void Asset_loader::set_log_callback(Log_callback callback)
{
    m_log_callback = std::move(callback);
}

void Asset_loader::log_error(const std::string& message) const
{
    if (m_log_callback) {
        m_log_callback(message);
    }
}

void Asset_loader::set_override_directory(std::string_view path)
{
    m_override_dir.assign(path.data(), path.size());
}

std::string_view Asset_loader::override_directory() const noexcept
{
    return m_override_dir;
}

void Asset_loader::register_embedded(std::string_view name, std::string_view data)
{
    m_embedded.insert_or_assign(std::string(name), data);
}

std::optional<std::string> Asset_loader::override_path(std::string_view name) const
{
    if (m_override_dir.empty()) {
        return std::nullopt;
    }

    const fs::path candidate = fs::path(m_override_dir) / fs::path(name);
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }
    return candidate.string();
}

std::optional<ByteBuffer> Asset_loader::load(std::string_view name) const
{
    if (const auto path = override_path(name)) {
        if (auto contents = read_whole_file(*path)) {
            return contents;
        }
        log_error("Asset_loader: cannot read override " + *path + ", using embedded copy");
    }

    const auto it = m_embedded.find(std::string(name));
    if (it == m_embedded.end()) {
        log_error("Asset_loader: no asset named " + std::string(name));
        return std::nullopt;
    }
    return ByteBuffer(it->second);
}

bool Asset_loader::exists(std::string_view name) const
{
    return override_path(name).has_value()
        || m_embedded.count(std::string(name)) > 0;
}

std::optional<Asset_loader::Shader_sources> Asset_loader::load_shader(std::string_view base_name) const
{
    const std::string base(base_name);

    auto vertex = load(base + ".vert");
    auto fragment = vertex ? load(base + ".frag") : std::nullopt;
    if (!vertex || !fragment) {
        log_error("Asset_loader: shader " + base + " needs both .vert and .frag");
        return std::nullopt;
    }

    return Shader_sources{std::move(*vertex), std::move(*fragment)};
}

Asset_loader& default_asset_loader()
{
    static Asset_loader loader;
    static std::once_flag registered;
    std::call_once(registered, [] { init_embedded_assets(loader); });
    return loader;
}

} // namespace vnm::flatland
