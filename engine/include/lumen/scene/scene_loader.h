#pragma once

#include <lumen/scene/scene.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace lumen
{

// Scene files are JSON:
//   { "width", "height", "samples_per_pixel", "max_depth",
//     "sky": null | { "texture": "" | "<image path>" },
//     "camera": { "look_from": {x,y,z}, "look_at", "vup", "vfov", "aspect" },
//     "objects": [ { "center": {x,y,z}, "radius", "material": { "<Kind>": {...} } } ] }
// Material kinds: Lambertian{albedo}, Metal{albedo, fuzz},
// Glass{index_of_refraction}, Texture{albedo, pixels: "<image path>", h_offset},
// Light{}. Colors are [r, g, b] arrays.
//
// Texture paths are tried as given, then relative to baseDir. All images are
// decoded here; a failure anywhere logs an error and yields std::nullopt.
std::optional<Scene> parseScene(const nlohmann::json& doc,
                                const std::filesystem::path& baseDir = {});
std::optional<Scene> loadScene(const std::string& path);

nlohmann::json sceneToJson(const Scene& scene);
bool saveScene(const std::string& path, const Scene& scene);

} // namespace lumen
