// =====================================================================
//  src/libmassing/massing/brep/operations.h — Solid construction
// =====================================================================
//
//  OpenCASCADE solids for committed massing volumes, for hosts that
//  export or analyze the model.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_BREP_OPERATIONS_H
#define MASSING_BREP_OPERATIONS_H

#include "../core.h"
#include "../geometry/types.h"
#include "../model/entities.h"

#include <TopoDS_Shape.hxx>

#include <QString>
#include <QVector>

namespace massing {
namespace brep {

// =====================================================================
//  Operation Results
// =====================================================================

/// Result of a BREP operation
struct OperationResult {
    bool success = false;
    TopoDS_Shape shape;
    QString errorMessage;
};

// =====================================================================
//  Construction
// =====================================================================

/// Planar face for a horizontal rectangle
/// @param center Rectangle center (its Y is the face height)
/// @param width Extent along X
/// @param depth Extent along Z
/// @return Result with the face
MASSING_EXPORT OperationResult makeFootprintFace(
    const geometry::Point3& center,
    double width,
    double depth);

/// Prism swept from an extrusion's footprint, up by depth for
/// extrusions and down by depth for intrusions
/// @param extrusion Committed extrusion
/// @return Result with the solid
MASSING_EXPORT OperationResult makeExtrusionSolid(const model::Extrusion& extrusion);

/// Solids for several extrusions; failures are skipped and logged
MASSING_EXPORT QVector<TopoDS_Shape> makeExtrusionSolids(const QVector<model::Extrusion>& extrusions);

// =====================================================================
//  Shape Queries
// =====================================================================

/// Volume of a shape (0 for a null shape)
MASSING_EXPORT double shapeVolume(const TopoDS_Shape& shape);

/// Axis-aligned bounds of a shape (empty box for a null shape)
MASSING_EXPORT geometry::BoundingBox3 shapeBounds(const TopoDS_Shape& shape);

}  // namespace brep
}  // namespace massing

#endif  // MASSING_BREP_OPERATIONS_H
