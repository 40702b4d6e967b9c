#pragma once

#include <lumen/core/math.h>
#include <lumen/core/random.h>
#include <lumen/raytracing/hit.h>
#include <lumen/raytracing/ray.h>
#include <lumen/scene/scene.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace lumen
{

// Minimum hit distance; keeps scattered rays from re-hitting their origin.
constexpr double HIT_EPSILON = 0.001;

// Dimming applied to equirectangular sky lookups.
constexpr float SKY_TEXTURE_SCALE = 0.7f;

// Closest hit over every object. Fills rec.objectIndex on success.
bool hitWorld(const std::vector<Sphere>& objects, const Ray& ray,
              double tMin, double tMax, HitRecord& rec);

// Background radiance for a ray that escaped the scene.
Color sampleSky(const std::optional<Sky>& sky, const Vector3& direction);

// Recursive radiance estimate along ray. depth counts down from maxDepth;
// lights holds the indices of the emissive objects (see findLights).
Color rayColor(const Ray& ray, const Scene& scene, const std::vector<uint32_t>& lights,
               int maxDepth, int depth, RNG& rng);

} // namespace lumen
