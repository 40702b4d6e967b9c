#include <lumen/raytracing/sphere.h>

#include <cmath>

namespace lumen
{

void sphericalUV(const Vector3& direction, double& u, double& v)
{
    Vector3 n = glm::normalize(direction);
    u = std::atan2(n.x, n.z) / (2.0 * PI) + 0.5;
    v = n.y * 0.5 + 0.5;
}

bool Sphere::hit(const Ray& ray, double tMin, double tMax, HitRecord& rec) const
{
    Vector3 oc = ray.origin - center;
    double a = lengthSquared(ray.direction);
    double halfB = glm::dot(oc, ray.direction);
    double c = lengthSquared(oc) - radius * radius;
    double discriminant = halfB * halfB - a * c;
    if (discriminant < 0.0)
        return false;

    double sqrtd = std::sqrt(discriminant);
    const double roots[2] = { (-halfB - sqrtd) / a, (-halfB + sqrtd) / a };
    for (double root : roots)
    {
        if (root <= tMin || root >= tMax)
            continue;

        Vector3 p = ray.at(root);
        Vector3 outward = (p - center) / radius;
        bool frontFace = glm::dot(ray.direction, outward) < 0.0;

        rec.t = root;
        rec.point = p;
        rec.normal = frontFace ? outward : -outward;
        rec.frontFace = frontFace;
        sphericalUV(p - center, rec.u, rec.v);
        return true;
    }
    return false;
}

} // namespace lumen
