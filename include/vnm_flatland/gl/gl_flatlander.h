#pragma once

// VNM Flatland Library - OpenGL Flatlander Factory

#include <vnm_flatland/core/asset_loader.h>
#include <vnm_flatland/core/flatland_config.h>
#include <vnm_flatland/core/flatlander.h>

#include <memory>

namespace vnm::flatland {

// Builds a Flatlander on the current GL context: compiles the flatland shader
// from `asset_loader`, queries the draw capabilities once and selects the
// dispatch strategy for the lifetime of the returned object.
// Returns nullptr if the shader cannot be loaded, compiled or linked; the
// cause is reported through config.log_error.
// Requires init_gl().
[[nodiscard]] std::unique_ptr<Flatlander> create_flatlander(
    const Asset_loader& asset_loader,
    const Flatland_config& config);

} // namespace vnm::flatland
