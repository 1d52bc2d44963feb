// =====================================================================
//  src/libmassing/massing/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libmassing.
//  These are lightweight value types for points, rays, and bounds in
//  scene space (Y up, the reference plane is horizontal).
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_GEOMETRY_TYPES_H
#define MASSING_GEOMETRY_TYPES_H

#include "../core.h"

#include <QVector3D>
#include <QVector>

namespace massing {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (scene units)
constexpr double DEFAULT_TOLERANCE = 1e-6;

/// Height of the reference (ground) plane
constexpr double REFERENCE_PLANE_HEIGHT = 0.0;

// =====================================================================
//  Point3
// =====================================================================

/// 3D point / vector with double precision
struct MASSING_EXPORT Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Point3() = default;
    Point3(double px, double py, double pz) : x(px), y(py), z(pz) {}

    /// Convert from a Qt float vector
    static Point3 fromVector(const QVector3D& v);

    /// Convert to a Qt float vector (for hosts feeding a Qt renderer)
    QVector3D toVector() const;

    /// Euclidean length
    double length() const;

    /// Distance to another point
    double distanceTo(const Point3& other) const;

    /// Unit vector in the same direction (zero vector stays zero)
    Point3 normalized() const;

    /// Dot product
    double dot(const Point3& other) const;

    /// Component-wise comparison within tolerance
    bool fuzzyEquals(const Point3& other, double tolerance = DEFAULT_TOLERANCE) const;

    Point3 operator+(const Point3& o) const { return Point3(x + o.x, y + o.y, z + o.z); }
    Point3 operator-(const Point3& o) const { return Point3(x - o.x, y - o.y, z - o.z); }
    Point3 operator*(double s) const { return Point3(x * s, y * s, z * s); }
    bool operator==(const Point3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Point3& o) const { return !(*this == o); }
};

// =====================================================================
//  Ray
// =====================================================================

/// Half-line from an origin along a direction (direction need not be unit)
struct MASSING_EXPORT Ray {
    Point3 origin;
    Point3 direction;

    Ray() = default;
    Ray(const Point3& o, const Point3& d) : origin(o), direction(d) {}

    /// Point at parametric distance t
    Point3 pointAt(double t) const { return origin + direction * t; }
};

// =====================================================================
//  Bounding Box
// =====================================================================

/// Axis-aligned 3D bounding box.  A default-constructed box is the
/// defined "empty" box (valid == false).
struct MASSING_EXPORT BoundingBox3 {
    Point3 min;
    Point3 max;
    bool valid = false;

    BoundingBox3() = default;
    BoundingBox3(const Point3& a, const Point3& b);
    explicit BoundingBox3(const Point3& point);

    /// Expand to include a point
    void include(const Point3& point);

    /// Expand to include another bounding box
    void include(const BoundingBox3& other);

    /// True when nothing has been included
    bool isEmpty() const { return !valid; }

    /// Get center point
    Point3 center() const;

    /// Extents along each axis
    Point3 size() const;

    /// Check if point is inside (inclusive)
    bool contains(const Point3& point) const;
};

}  // namespace geometry
}  // namespace massing

#endif  // MASSING_GEOMETRY_TYPES_H
