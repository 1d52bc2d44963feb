// =====================================================================
//  src/libmassing/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/geometry/types.h>

#include <QtMath>

namespace massing {
namespace geometry {

// =====================================================================
//  Point3 Implementation
// =====================================================================

Point3 Point3::fromVector(const QVector3D& v)
{
    return Point3(v.x(), v.y(), v.z());
}

QVector3D Point3::toVector() const
{
    return QVector3D(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));
}

double Point3::length() const
{
    return qSqrt(x * x + y * y + z * z);
}

double Point3::distanceTo(const Point3& other) const
{
    return (*this - other).length();
}

Point3 Point3::normalized() const
{
    double len = length();
    if (len < DEFAULT_TOLERANCE) {
        return Point3();
    }
    return Point3(x / len, y / len, z / len);
}

double Point3::dot(const Point3& other) const
{
    return x * other.x + y * other.y + z * other.z;
}

bool Point3::fuzzyEquals(const Point3& other, double tolerance) const
{
    return qAbs(x - other.x) <= tolerance &&
           qAbs(y - other.y) <= tolerance &&
           qAbs(z - other.z) <= tolerance;
}

// =====================================================================
//  BoundingBox3 Implementation
// =====================================================================

BoundingBox3::BoundingBox3(const Point3& a, const Point3& b)
    : min(qMin(a.x, b.x), qMin(a.y, b.y), qMin(a.z, b.z))
    , max(qMax(a.x, b.x), qMax(a.y, b.y), qMax(a.z, b.z))
    , valid(true)
{
}

BoundingBox3::BoundingBox3(const Point3& point)
    : min(point)
    , max(point)
    , valid(true)
{
}

void BoundingBox3::include(const Point3& point)
{
    if (!valid) {
        min = max = point;
        valid = true;
    } else {
        min.x = qMin(min.x, point.x);
        min.y = qMin(min.y, point.y);
        min.z = qMin(min.z, point.z);
        max.x = qMax(max.x, point.x);
        max.y = qMax(max.y, point.y);
        max.z = qMax(max.z, point.z);
    }
}

void BoundingBox3::include(const BoundingBox3& other)
{
    if (!other.valid) return;

    if (!valid) {
        *this = other;
    } else {
        include(other.min);
        include(other.max);
    }
}

Point3 BoundingBox3::center() const
{
    return Point3((min.x + max.x) / 2.0, (min.y + max.y) / 2.0, (min.z + max.z) / 2.0);
}

Point3 BoundingBox3::size() const
{
    if (!valid) return Point3();
    return max - min;
}

bool BoundingBox3::contains(const Point3& point) const
{
    if (!valid) return false;
    return point.x >= min.x && point.x <= max.x &&
           point.y >= min.y && point.y <= max.y &&
           point.z >= min.z && point.z <= max.z;
}

}  // namespace geometry
}  // namespace massing
