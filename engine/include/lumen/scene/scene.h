#pragma once

#include <lumen/core/camera.h>
#include <lumen/image/image_io.h>
#include <lumen/raytracing/sphere.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace lumen
{

struct Sky
{
    // Equirectangular environment image; null means the white-to-blue gradient.
    std::shared_ptr<const TextureData> texture;

    static Sky gradient() { return Sky{}; }
    bool hasTexture() const { return texture && !texture->empty(); }
};

// Everything a render needs. Immutable while a render is running.
struct Scene
{
    uint32_t width = 800;
    uint32_t height = 600;
    uint32_t samplesPerPixel = 64;
    uint32_t maxDepth = 50;
    std::optional<Sky> sky; // no sky: black background
    Camera camera;
    std::vector<Sphere> objects;
};

// Indices of the objects whose material is emissive, in scene order.
std::vector<uint32_t> findLights(const std::vector<Sphere>& objects);

// Advances the rotation of every textured material by delta turns.
void rotateTextures(std::vector<Sphere>& objects, double delta);

} // namespace lumen
