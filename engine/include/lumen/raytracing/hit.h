#pragma once

#include <lumen/core/math.h>

#include <cstdint>
#include <limits>

namespace lumen
{

struct HitRecord
{
    double t = std::numeric_limits<double>::max();
    Vector3 point{0.0};
    Vector3 normal{0.0};   // always faces against the incoming ray
    bool frontFace = true; // ray arrived on the side the outward normal points to
    double u = 0.0;        // equirectangular surface coordinates
    double v = 0.0;
    uint32_t objectIndex = UINT32_MAX; // into Scene::objects
};

} // namespace lumen
