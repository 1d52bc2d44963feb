// =====================================================================
//  src/libmassing/render/entityrenderer.cpp — Committed entity geometry
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/render/entityrenderer.h>

namespace massing {
namespace render {

using geometry::Point3;

namespace {

const QColor EDGE_COLOR(0x1e, 0x40, 0xaf);
const QColor OUTLINE_COLOR(0xef, 0x44, 0x44);
const QColor CORNER_COLOR(0x3b, 0x82, 0xf6);
const QColor CENTER_MARKER_COLOR(0x10, 0xb9, 0x81);

constexpr double SOLID_OPACITY = 0.8;
constexpr double CORNER_OPACITY = 0.6;
constexpr double OUTLINE_LIFT = 0.01;
constexpr double MARKER_LIFT = 0.02;
constexpr double HALO_MARGIN = 0.02;

}  // anonymous namespace

// =====================================================================
//  Extrusions
// =====================================================================

QColor extrusionColor(const model::Extrusion& extrusion, bool selected, const ToolSettings& settings)
{
    if (selected) {
        return settings.highlightColor;
    }
    if (extrusion.isIntrusion) {
        return settings.intrusionColor;
    }
    return extrusion.color.isValid() ? extrusion.color : settings.defaultFootprintColor;
}

geometry::BoundingBox3 extrusionBounds(const model::Extrusion& extrusion)
{
    const Point3& p = extrusion.position;
    const double hw = extrusion.width / 2.0;
    const double hh = extrusion.height / 2.0;
    const double capY = p.y + extrusion.signedDepth();

    return geometry::BoundingBox3(Point3(p.x - hw, p.y, p.z - hh),
                                  Point3(p.x + hw, capY, p.z + hh));
}

QVector<Primitive> buildExtrusionPrimitives(
    const model::Extrusion& extrusion,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings)
{
    QVector<Primitive> out;

    const bool selected = !selectedId.isEmpty() && selectedId == extrusion.id;
    const bool visible = model::isLayerVisible(layers, extrusion.layerId);
    const double opacity = visible ? SOLID_OPACITY : settings.hiddenLayerOpacity;

    const Point3& base = extrusion.position;
    const double halfDepth = extrusion.depth / 2.0;
    const Point3 boxCenter(base.x, base.y + (extrusion.isIntrusion ? -halfDepth : halfDepth), base.z);
    const Point3 boxSize(extrusion.width, extrusion.depth, extrusion.height);

    Primitive solid;
    solid.kind = PrimitiveKind::Box;
    solid.role = QStringLiteral("extrusion.solid");
    solid.center = boxCenter;
    solid.size = boxSize;
    solid.rotation = extrusion.rotation;
    solid.color = extrusionColor(extrusion, selected, settings);
    solid.opacity = opacity;
    solid.depthTest = false;
    out.append(solid);

    Primitive edges;
    edges.kind = PrimitiveKind::BoxEdges;
    edges.role = QStringLiteral("extrusion.edges");
    edges.center = boxCenter;
    edges.size = boxSize;
    edges.rotation = extrusion.rotation;
    edges.color = selected ? settings.highlightColor : EDGE_COLOR;
    edges.opacity = opacity;
    edges.lineWidth = selected ? 2.0 : 1.0;
    edges.depthTest = false;
    out.append(edges);

    if (!selected) {
        return out;
    }

    // ---- Selection indicators ----

    Primitive baseOutline;
    baseOutline.kind = PrimitiveKind::LineSegments;
    baseOutline.role = QStringLiteral("extrusion.base-outline");
    baseOutline.center = Point3(base.x, base.y + OUTLINE_LIFT, base.z);
    baseOutline.vertices = rectangleOutline(extrusion.width, extrusion.height);
    baseOutline.color = OUTLINE_COLOR;
    baseOutline.opacity = SOLID_OPACITY;
    baseOutline.lineWidth = 2.0;
    baseOutline.depthTest = false;
    out.append(baseOutline);

    Primitive topOutline = baseOutline;
    topOutline.role = QStringLiteral("extrusion.top-outline");
    topOutline.center = Point3(base.x, base.y + extrusion.signedDepth(), base.z);
    out.append(topOutline);

    const double hw = extrusion.width / 2.0;
    const double hh = extrusion.height / 2.0;
    const Point3 corners[] = {
        Point3(-hw, 0.0, -hh), Point3(hw, 0.0, -hh),
        Point3(hw, 0.0, hh),   Point3(-hw, 0.0, hh)
    };

    for (const Point3& corner : corners) {
        Primitive segment;
        segment.kind = PrimitiveKind::LineSegments;
        segment.role = QStringLiteral("extrusion.corner");
        segment.center = Point3(base.x + corner.x, boxCenter.y, base.z + corner.z);
        segment.vertices = { Point3(0.0, -halfDepth, 0.0), Point3(0.0, halfDepth, 0.0) };
        segment.color = CORNER_COLOR;
        segment.opacity = CORNER_OPACITY;
        segment.depthTest = false;
        out.append(segment);
    }

    return out;
}

// =====================================================================
//  Footprints
// =====================================================================

QVector<Primitive> buildRectanglePrimitives(
    const model::Rectangle& rectangle,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings)
{
    QVector<Primitive> out;

    const model::Layer* layer = model::findLayer(layers, rectangle.layerId);
    if (layer && !layer->visible) {
        return out;
    }

    const bool selected = !selectedId.isEmpty() && selectedId == rectangle.id;

    QColor layerColor = settings.defaultFootprintColor;
    if (layer && layer->color.isValid()) {
        layerColor = layer->color;
    } else if (rectangle.color.isValid()) {
        layerColor = rectangle.color;
    }

    Primitive plane;
    plane.kind = PrimitiveKind::Plane;
    plane.role = QStringLiteral("rectangle.plane");
    plane.center = rectangle.position;
    plane.size = Point3(rectangle.width, rectangle.height, 0.0);
    plane.rotation = rectangle.rotation;
    plane.color = selected ? settings.highlightColor : layerColor;
    plane.wireframe = selected;
    out.append(plane);

    if (selected) {
        Primitive halo = plane;
        halo.role = QStringLiteral("rectangle.halo");
        halo.size = Point3(rectangle.width + HALO_MARGIN, rectangle.height + HALO_MARGIN, 0.0);
        halo.color = settings.highlightColor;
        halo.opacity = 0.3;
        halo.wireframe = true;
        out.append(halo);
    }

    Primitive edges = plane;
    edges.kind = PrimitiveKind::PlaneEdges;
    edges.role = QStringLiteral("rectangle.edges");
    edges.color = selected ? settings.highlightColor : EDGE_COLOR;
    edges.lineWidth = selected ? 3.0 : 1.0;
    edges.wireframe = false;
    out.append(edges);

    if (!selected) {
        return out;
    }

    // ---- Corner and center markers ----

    const double markerY = rectangle.startPoint.y + MARKER_LIFT;

    Primitive startMarker;
    startMarker.kind = PrimitiveKind::Sphere;
    startMarker.role = QStringLiteral("rectangle.start-marker");
    startMarker.center = Point3(rectangle.startPoint.x, markerY, rectangle.startPoint.z);
    startMarker.size = Point3(0.03, 0.0, 0.0);
    startMarker.color = OUTLINE_COLOR;
    out.append(startMarker);

    Primitive endMarker = startMarker;
    endMarker.role = QStringLiteral("rectangle.end-marker");
    endMarker.center = Point3(rectangle.endPoint.x, markerY, rectangle.endPoint.z);
    out.append(endMarker);

    Primitive centerMarker = startMarker;
    centerMarker.role = QStringLiteral("rectangle.center-marker");
    centerMarker.center = Point3(rectangle.position.x, markerY, rectangle.position.z);
    centerMarker.size = Point3(0.02, 0.0, 0.0);
    centerMarker.color = CENTER_MARKER_COLOR;
    out.append(centerMarker);

    return out;
}

// =====================================================================
//  Scene
// =====================================================================

QVector<Primitive> buildScenePrimitives(
    const QVector<model::Rectangle>& rectangles,
    const QVector<model::Extrusion>& extrusions,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings)
{
    QVector<Primitive> out;
    for (const model::Rectangle& rect : rectangles) {
        out += buildRectanglePrimitives(rect, selectedId, layers, settings);
    }
    for (const model::Extrusion& ext : extrusions) {
        out += buildExtrusionPrimitives(ext, selectedId, layers, settings);
    }
    return out;
}

}  // namespace render
}  // namespace massing
