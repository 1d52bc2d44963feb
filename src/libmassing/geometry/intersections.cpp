// =====================================================================
//  src/libmassing/geometry/intersections.cpp — Ray intersection functions
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/geometry/intersections.h>

#include <QVector4D>
#include <QtMath>

namespace massing {
namespace geometry {

// =====================================================================
//  Ray-Plane
// =====================================================================

std::optional<double> rayPlaneDistance(
    const Ray& ray,
    double planeHeight,
    double parallelTolerance)
{
    const double dy = ray.direction.y;
    if (qAbs(dy) < parallelTolerance) {
        return std::nullopt;  // Parallel
    }

    const double t = (planeHeight - ray.origin.y) / dy;
    if (t < 0.0) {
        return std::nullopt;  // Plane behind the origin
    }

    return t;
}

std::optional<Point3> intersectGround(
    const Ray& ray,
    double planeHeight,
    double parallelTolerance)
{
    const std::optional<double> t = rayPlaneDistance(ray, planeHeight, parallelTolerance);
    if (!t) {
        return std::nullopt;
    }

    Point3 hit = ray.pointAt(*t);
    hit.y = planeHeight;  // Snap away floating-point noise
    return hit;
}

// =====================================================================
//  Ray-Footprint
// =====================================================================

std::optional<double> rayRectangleDistance(
    const Ray& ray,
    const Point3& center,
    double width,
    double height,
    double parallelTolerance)
{
    if (width <= 0.0 || height <= 0.0) {
        return std::nullopt;
    }

    const std::optional<double> t = rayPlaneDistance(ray, center.y, parallelTolerance);
    if (!t) {
        return std::nullopt;
    }

    const Point3 hit = ray.pointAt(*t);
    const double halfW = width / 2.0;
    const double halfH = height / 2.0;

    if (hit.x < center.x - halfW || hit.x > center.x + halfW ||
        hit.z < center.z - halfH || hit.z > center.z + halfH) {
        return std::nullopt;
    }

    return t;
}

// =====================================================================
//  Screen Projection
// =====================================================================

std::optional<Ray> rayFromScreen(
    const QPointF& screenPos,
    const QSize& viewportSize,
    const QMatrix4x4& view,
    const QMatrix4x4& projection)
{
    if (viewportSize.width() <= 0 || viewportSize.height() <= 0) {
        return std::nullopt;
    }

    bool invertible = false;
    const QMatrix4x4 inverse = (projection * view).inverted(&invertible);
    if (!invertible) {
        return std::nullopt;
    }

    // Normalized device coordinates (Y up)
    const float ndcX = static_cast<float>(2.0 * screenPos.x() / viewportSize.width() - 1.0);
    const float ndcY = static_cast<float>(1.0 - 2.0 * screenPos.y() / viewportSize.height());

    QVector4D nearPoint = inverse * QVector4D(ndcX, ndcY, -1.0f, 1.0f);
    QVector4D farPoint = inverse * QVector4D(ndcX, ndcY, 1.0f, 1.0f);
    if (qFuzzyIsNull(nearPoint.w()) || qFuzzyIsNull(farPoint.w())) {
        return std::nullopt;
    }
    nearPoint /= nearPoint.w();
    farPoint /= farPoint.w();

    const Point3 origin = Point3::fromVector(nearPoint.toVector3D());
    const Point3 direction = (Point3::fromVector(farPoint.toVector3D()) - origin).normalized();
    if (direction.length() < DEFAULT_TOLERANCE) {
        return std::nullopt;
    }

    return Ray(origin, direction);
}

}  // namespace geometry
}  // namespace massing
