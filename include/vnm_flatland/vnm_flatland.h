#pragma once
// VNM Flatland Library - Main Header
// Batched, indirectly drawn 2D glyph/sprite rendering.
//
// This library provides:
// - Alphabets: reference-counted, shareable glyph/sprite geometry
// - Groups: positioned, colored instances of alphabet entries
// - Incremental GPU upload driven by three dirty channels
// - A single multi-draw-indirect call per frame (per-group fallback)
//
// Usage:
//   vnm::flatland::init_gl();
//   auto flatlander = vnm::flatland::create_flatlander(
//       vnm::flatland::default_asset_loader(), vnm::flatland::Flatland_config::make_default());
//   auto alphabet = flatlander->create_alphabet();
//   auto entry = alphabet.add_entry(id, vertices, indices);
//   vnm::flatland::Flatland_group group(transform, color, alphabet, {{*entry, 10, 20}});
//   flatlander->render(view_projection);   // once per frame
#include <vnm_flatland/core/types.h>
#include <vnm_flatland/core/constants.h>
#include <vnm_flatland/core/flatland_config.h>
#include <vnm_flatland/core/asset_loader.h>
#include <vnm_flatland/core/flatland.h>
#include <vnm_flatland/core/handles.h>
#include <vnm_flatland/core/buffer_stage.h>
#include <vnm_flatland/core/draw_dispatch.h>
#include <vnm_flatland/core/flatlander.h>

#if defined(VNM_FLATLAND_WITH_GL)
#include <vnm_flatland/gl/gl_program.h>
#include <vnm_flatland/gl/gl_flatlander.h>
#endif

namespace vnm::flatland {

// Library version
constexpr int k_version_major = 0;
constexpr int k_version_minor = 1;
constexpr int k_version_patch = 0;

constexpr const char* k_version_string = "0.1.0";

} // namespace vnm::flatland
