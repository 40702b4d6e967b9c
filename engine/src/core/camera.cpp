#include <lumen/core/camera.h>
#include <cmath>

namespace lumen
{

Camera::Camera()
    : Camera(CameraParams{})
{
}

Camera::Camera(const Vector3& lookFrom, const Vector3& lookAt, const Vector3& vup,
               double vfov, double aspect)
    : Camera(CameraParams{ lookFrom, lookAt, vup, vfov, aspect })
{
}

Camera::Camera(const CameraParams& params)
    : m_params(params)
{
    double theta = params.vfov * PI / 180.0;
    double halfHeight = std::tan(theta / 2.0);
    double halfWidth = params.aspect * halfHeight;

    m_w = glm::normalize(params.lookFrom - params.lookAt);
    m_u = glm::normalize(glm::cross(params.vup, m_w));
    m_v = glm::cross(m_w, m_u);

    m_origin = params.lookFrom;
    m_lowerLeftCorner = m_origin - m_u * halfWidth - m_v * halfHeight - m_w;
    m_horizontal = m_u * (2.0 * halfWidth);
    m_vertical = m_v * (2.0 * halfHeight);
}

Ray Camera::getRay(double s, double t) const
{
    return { m_origin, m_lowerLeftCorner + m_horizontal * s + m_vertical * t - m_origin };
}

} // namespace lumen
