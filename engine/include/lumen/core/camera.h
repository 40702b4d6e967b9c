#pragma once

#include <lumen/core/math.h>
#include <lumen/raytracing/ray.h>

namespace lumen
{

struct CameraParams
{
    Vector3 lookFrom{0.0, 0.0, 0.0};
    Vector3 lookAt{0.0, 0.0, -1.0};
    Vector3 vup{0.0, 1.0, 0.0};
    double vfov = 90.0;  // vertical field of view, degrees
    double aspect = 1.0;
};

// Pinhole camera. The view frame is computed once at construction; vup must
// not be parallel to the view direction.
class Camera
{
public:
    Camera();
    explicit Camera(const CameraParams& params);
    Camera(const Vector3& lookFrom, const Vector3& lookAt, const Vector3& vup,
           double vfov, double aspect);

    // s, t in [0,1] from the lower-left corner of the image plane.
    Ray getRay(double s, double t) const;

    const CameraParams& getParams() const { return m_params; }

    const Vector3& getOrigin() const { return m_origin; }
    const Vector3& getLowerLeftCorner() const { return m_lowerLeftCorner; }
    const Vector3& getHorizontal() const { return m_horizontal; }
    const Vector3& getVertical() const { return m_vertical; }
    const Vector3& getU() const { return m_u; }
    const Vector3& getV() const { return m_v; }
    const Vector3& getW() const { return m_w; }

private:
    CameraParams m_params;

    Vector3 m_origin;
    Vector3 m_lowerLeftCorner;
    Vector3 m_horizontal;
    Vector3 m_vertical;
    Vector3 m_u, m_v, m_w;
};

} // namespace lumen
