#pragma once

#include <lumen/core/math.h>

namespace lumen
{

struct Ray
{
    Vector3 origin{0.0};
    Vector3 direction{0.0}; // not necessarily unit length

    Vector3 at(double t) const { return origin + t * direction; }
};

} // namespace lumen
