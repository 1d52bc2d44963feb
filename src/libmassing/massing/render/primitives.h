// =====================================================================
//  src/libmassing/massing/render/primitives.h — Declarative draw commands
// =====================================================================
//
//  The library does not draw.  Builders in this directory map entities
//  and tool snapshots to Primitive lists that a host renderer consumes.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_RENDER_PRIMITIVES_H
#define MASSING_RENDER_PRIMITIVES_H

#include "../core.h"
#include "../geometry/types.h"

#include <QColor>
#include <QString>
#include <QVector>

namespace massing {
namespace render {

/// Kind of draw command
enum class PrimitiveKind {
    Box,            ///< Solid box; size = extents along X, Y, Z
    BoxEdges,       ///< Edge wireframe of a box; size as Box
    Plane,          ///< Filled plane; size.x / size.y = plane-local width / height
    PlaneEdges,     ///< Outline of a plane; size as Plane
    LineSegments,   ///< Vertex pairs relative to center
    Sphere,         ///< Point marker; size.x = radius
    Ring            ///< Flat ring marker; size.x = inner, size.y = outer radius
};

/// One draw command with per-instance transform and material
struct MASSING_EXPORT Primitive {
    PrimitiveKind kind = PrimitiveKind::Box;
    QString role;                           ///< What the primitive shows, e.g. "extrusion.solid"
    geometry::Point3 center;                ///< World position
    geometry::Point3 size;
    geometry::Point3 rotation;              ///< Euler angles (radians, XYZ order)
    QVector<geometry::Point3> vertices;     ///< LineSegments only
    QColor color;
    double opacity = 1.0;
    double lineWidth = 1.0;
    bool wireframe = false;                 ///< Draw a Plane as wireframe
    bool depthTest = true;

    bool isTranslucent() const { return opacity < 1.0; }
};

/// Outline of an axis-aligned width x depth rectangle centered on the
/// origin in the XZ plane, as 4 segments (8 vertices)
MASSING_EXPORT QVector<geometry::Point3> rectangleOutline(double width, double depth);

/// First primitive with the given role, or nullptr
MASSING_EXPORT const Primitive* findPrimitive(const QVector<Primitive>& primitives, const QString& role);

}  // namespace render
}  // namespace massing

#endif  // MASSING_RENDER_PRIMITIVES_H
