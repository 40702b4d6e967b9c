#pragma once

#include <lumen/core/math.h>
#include <lumen/raytracing/hit.h>
#include <lumen/raytracing/material.h>
#include <lumen/raytracing/ray.h>

namespace lumen
{

struct Sphere
{
    Vector3 center{0.0};
    double radius = 1.0; // negative radius turns the normals inward (hollow shell)
    Material material = DiffuseMaterial{};

    // Nearest root strictly inside (tMin, tMax). Leaves rec.objectIndex untouched.
    bool hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const;
};

// Longitude/latitude of a direction: u = atan2(x,z)/2pi + 0.5, v = y/2 + 0.5.
void sphericalUV(const Vector3& direction, double& u, double& v);

} // namespace lumen
