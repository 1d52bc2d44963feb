// =====================================================================
//  src/libmassing/brep/operations.cpp — Solid construction
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/brep/operations.h>

// OpenCASCADE includes
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <Bnd_Box.hxx>
#include <BRepBndLib.hxx>
#include <Standard_Failure.hxx>

// Wire/Face building
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>

// 3D operations
#include <BRepPrimAPI_MakePrism.hxx>

// Geometry
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>

#include <QLoggingCategory>

namespace massing {
namespace brep {

Q_LOGGING_CATEGORY(logBrep, "massing.brep.operations")

// =====================================================================
//  Construction
// =====================================================================

OperationResult makeFootprintFace(
    const geometry::Point3& center,
    double width,
    double depth)
{
    OperationResult result;

    if (width <= 0.0 || depth <= 0.0) {
        result.errorMessage = QStringLiteral("Footprint must have positive width and depth");
        return result;
    }

    const double hw = width / 2.0;
    const double hd = depth / 2.0;

    try {
        BRepBuilderAPI_MakePolygon polygon(
            gp_Pnt(center.x - hw, center.y, center.z - hd),
            gp_Pnt(center.x + hw, center.y, center.z - hd),
            gp_Pnt(center.x + hw, center.y, center.z + hd),
            gp_Pnt(center.x - hw, center.y, center.z + hd),
            Standard_True);  // close
        if (!polygon.IsDone()) {
            result.errorMessage = QStringLiteral("Failed to build footprint wire");
            return result;
        }

        BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);  // planar only
        if (!face.IsDone()) {
            result.errorMessage = QStringLiteral("Failed to build footprint face");
            return result;
        }

        result.shape = face.Face();
        result.success = true;
    } catch (const Standard_Failure& e) {
        result.errorMessage = QStringLiteral("Exception building footprint: %1")
                                  .arg(QString::fromLatin1(e.GetMessageString()));
        qCWarning(logBrep) << "makeFootprintFace:exception" << result.errorMessage;
    }

    return result;
}

OperationResult makeExtrusionSolid(const model::Extrusion& extrusion)
{
    OperationResult result;

    if (extrusion.depth <= 0.0) {
        result.errorMessage = QStringLiteral("Extrusion depth must be positive");
        return result;
    }

    const OperationResult face = makeFootprintFace(extrusion.position, extrusion.width,
                                                   extrusion.height);
    if (!face.success) {
        result.errorMessage = face.errorMessage;
        return result;
    }

    const gp_Vec sweep(0.0, extrusion.signedDepth(), 0.0);

    try {
        BRepPrimAPI_MakePrism prism(face.shape, sweep, Standard_True);  // copy = true
        if (prism.IsDone()) {
            result.shape = prism.Shape();
            result.success = true;
        } else {
            result.errorMessage = QStringLiteral("Extrusion operation failed");
        }
    } catch (const Standard_Failure& e) {
        result.errorMessage = QStringLiteral("Exception during extrusion: %1")
                                  .arg(QString::fromLatin1(e.GetMessageString()));
    }

    if (!result.success) {
        qCWarning(logBrep) << "makeExtrusionSolid:failed" << extrusion.id << result.errorMessage;
    }
    return result;
}

QVector<TopoDS_Shape> makeExtrusionSolids(const QVector<model::Extrusion>& extrusions)
{
    QVector<TopoDS_Shape> solids;
    solids.reserve(extrusions.size());

    for (const model::Extrusion& ext : extrusions) {
        const OperationResult r = makeExtrusionSolid(ext);
        if (r.success) {
            solids.append(r.shape);
        }
    }

    qCDebug(logBrep) << "makeExtrusionSolids:built" << solids.size() << "of" << extrusions.size();
    return solids;
}

// =====================================================================
//  Shape Queries
// =====================================================================

double shapeVolume(const TopoDS_Shape& shape)
{
    if (shape.IsNull()) return 0.0;

    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.Mass();
}

geometry::BoundingBox3 shapeBounds(const TopoDS_Shape& shape)
{
    if (shape.IsNull()) return geometry::BoundingBox3();

    Bnd_Box box;
    BRepBndLib::Add(shape, box);

    if (box.IsVoid()) return geometry::BoundingBox3();

    double xmin, ymin, zmin, xmax, ymax, zmax;
    box.Get(xmin, ymin, zmin, xmax, ymax, zmax);

    return geometry::BoundingBox3(geometry::Point3(xmin, ymin, zmin),
                                  geometry::Point3(xmax, ymax, zmax));
}

}  // namespace brep
}  // namespace massing
