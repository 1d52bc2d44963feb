// =====================================================================
//  src/libmassing/massing/geometry/intersections.h — Ray intersection functions
// =====================================================================
//
//  Functions for projecting pointer rays onto the horizontal reference
//  plane and onto flat footprints lying on it.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_GEOMETRY_INTERSECTIONS_H
#define MASSING_GEOMETRY_INTERSECTIONS_H

#include "types.h"

#include <QMatrix4x4>
#include <QPointF>
#include <QSize>

#include <optional>

namespace massing {
namespace geometry {

// =====================================================================
//  Ray-Plane
// =====================================================================

/// Intersect a ray with the horizontal plane y = planeHeight
/// @param ray Pointer ray (origin + direction)
/// @param planeHeight Height of the horizontal plane
/// @param parallelTolerance Rays whose |direction.y| is below this are
///        treated as parallel to the plane
/// @return Intersection point (y == planeHeight), or empty when the ray
///         is parallel to the plane or the plane lies behind the origin
MASSING_EXPORT std::optional<Point3> intersectGround(
    const Ray& ray,
    double planeHeight = REFERENCE_PLANE_HEIGHT,
    double parallelTolerance = DEFAULT_TOLERANCE);

/// Parametric distance along the ray to the plane y = planeHeight
/// @return t >= 0 on a hit, empty otherwise
MASSING_EXPORT std::optional<double> rayPlaneDistance(
    const Ray& ray,
    double planeHeight,
    double parallelTolerance = DEFAULT_TOLERANCE);

// =====================================================================
//  Ray-Footprint
// =====================================================================

/// Intersect a ray with a horizontal rectangle
/// @param ray Pointer ray
/// @param center Rectangle center (its y is the plane height)
/// @param width Extent along X
/// @param height Extent along Z
/// @param parallelTolerance See intersectGround()
/// @return Ray distance t of the hit (edges inclusive), or empty
MASSING_EXPORT std::optional<double> rayRectangleDistance(
    const Ray& ray,
    const Point3& center,
    double width,
    double height,
    double parallelTolerance = DEFAULT_TOLERANCE);

// =====================================================================
//  Screen Projection
// =====================================================================

/// Build a world-space pointer ray from a screen position
/// @param screenPos Pointer position in pixels (origin top-left)
/// @param viewportSize Viewport size in pixels
/// @param view Camera view matrix
/// @param projection Camera projection matrix
/// @return Ray from the near plane towards the far plane (unit direction),
///         or empty for a degenerate viewport or non-invertible matrices
MASSING_EXPORT std::optional<Ray> rayFromScreen(
    const QPointF& screenPos,
    const QSize& viewportSize,
    const QMatrix4x4& view,
    const QMatrix4x4& projection);

}  // namespace geometry
}  // namespace massing

#endif  // MASSING_GEOMETRY_INTERSECTIONS_H
