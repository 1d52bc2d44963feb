// =====================================================================
//  src/libmassing/render/toolpreview.cpp — In-progress gesture geometry
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/render/toolpreview.h>
#include <massing/tools/toolmanager.h>

#include <QtMath>

namespace massing {
namespace render {

using geometry::Point3;

namespace {

const QColor DRAFT_OUTLINE_COLOR(0x1d, 0x4e, 0xd8);
const QColor START_MARKER_COLOR(0xef, 0x44, 0x44);
const QColor CURSOR_COLOR(0x6b, 0x72, 0x80);
const QColor HOVER_FILL_COLOR(0x10, 0xb9, 0x81);
const QColor HOVER_OUTLINE_COLOR(0x05, 0x96, 0x69);
const QColor INTRUSION_EDGE_COLOR(0xdc, 0x26, 0x26);
const QColor EXTRUSION_EDGE_COLOR(0x1d, 0x4e, 0xd8);

/// Heights below this are not worth drawing
constexpr double MIN_PREVIEW_HEIGHT = 0.01;

}  // anonymous namespace

// =====================================================================
//  Rectangle Draft
// =====================================================================

QVector<Primitive> buildRectanglePreview(
    const tools::RectangleTool::State& state,
    const ToolSettings& settings)
{
    QVector<Primitive> out;
    const double ground = settings.groundHeight;

    if (const auto* idle = std::get_if<tools::RectangleTool::Idle>(&state)) {
        if (idle->hoverPoint) {
            Primitive cursor;
            cursor.kind = PrimitiveKind::Ring;
            cursor.role = QStringLiteral("preview.cursor");
            cursor.center = Point3(idle->hoverPoint->x, ground + 0.01, idle->hoverPoint->z);
            cursor.size = Point3(0.05, 0.08, 0.0);
            cursor.rotation = model::flatRotation();
            cursor.color = CURSOR_COLOR;
            cursor.opacity = 0.3;
            out.append(cursor);
        }
        return out;
    }

    const auto& draft = std::get<tools::RectangleTool::Drafting>(state);

    if (draft.previewVisible) {
        const double width = qAbs(draft.current.x - draft.start.x);
        const double depth = qAbs(draft.current.z - draft.start.z);
        const double midX = (draft.start.x + draft.current.x) / 2.0;
        const double midZ = (draft.start.z + draft.current.z) / 2.0;

        Primitive plane;
        plane.kind = PrimitiveKind::Plane;
        plane.role = QStringLiteral("preview.plane");
        plane.center = Point3(midX, ground + 0.02, midZ);
        plane.size = Point3(width, depth, 0.0);
        plane.rotation = model::flatRotation();
        plane.color = settings.defaultFootprintColor;
        plane.opacity = 0.3;
        plane.depthTest = false;
        out.append(plane);

        Primitive outline;
        outline.kind = PrimitiveKind::LineSegments;
        outline.role = QStringLiteral("preview.outline");
        outline.center = Point3(midX, ground + 0.03, midZ);
        outline.vertices = rectangleOutline(width, depth);
        outline.color = DRAFT_OUTLINE_COLOR;
        outline.lineWidth = 2.0;
        outline.depthTest = false;
        out.append(outline);
    }

    Primitive startMarker;
    startMarker.kind = PrimitiveKind::Sphere;
    startMarker.role = QStringLiteral("preview.start-marker");
    startMarker.center = Point3(draft.start.x, ground + 0.05, draft.start.z);
    startMarker.size = Point3(0.08, 0.0, 0.0);
    startMarker.color = START_MARKER_COLOR;
    out.append(startMarker);

    return out;
}

// =====================================================================
//  Push / Pull
// =====================================================================

namespace {

QVector<Primitive> buildPushPullFeedback(
    const tools::PushPullTool::State& state,
    const ToolSettings& settings)
{
    QVector<Primitive> out;

    if (const auto* hovering = std::get_if<tools::PushPullTool::Hovering>(&state)) {
        const model::Rectangle& target = hovering->target;

        Primitive overlay;
        overlay.kind = PrimitiveKind::Plane;
        overlay.role = QStringLiteral("preview.hover");
        overlay.center = Point3(target.position.x, target.position.y + 0.01, target.position.z);
        overlay.size = Point3(target.width, target.height, 0.0);
        overlay.rotation = model::flatRotation();
        overlay.color = HOVER_FILL_COLOR;
        overlay.opacity = 0.3;
        out.append(overlay);

        Primitive outline;
        outline.kind = PrimitiveKind::LineSegments;
        outline.role = QStringLiteral("preview.hover-outline");
        outline.center = Point3(target.position.x, target.position.y + 0.02, target.position.z);
        outline.vertices = rectangleOutline(target.width, target.height);
        outline.color = HOVER_OUTLINE_COLOR;
        outline.opacity = 0.8;
        outline.lineWidth = 2.0;
        out.append(outline);
        return out;
    }

    const auto* drag = std::get_if<tools::PushPullTool::Extruding>(&state);
    if (!drag || qAbs(drag->height) <= MIN_PREVIEW_HEIGHT) {
        return out;
    }

    const model::Rectangle& base = drag->target;
    const bool intrusion = drag->height < 0.0;
    const Point3 center(base.position.x, base.position.y + drag->height / 2.0, base.position.z);
    const Point3 size(base.width, qAbs(drag->height), base.height);

    Primitive volume;
    volume.kind = PrimitiveKind::Box;
    volume.role = QStringLiteral("preview.volume");
    volume.center = center;
    volume.size = size;
    volume.color = intrusion ? settings.intrusionColor : settings.defaultFootprintColor;
    volume.opacity = 0.6;
    out.append(volume);

    Primitive edges = volume;
    edges.kind = PrimitiveKind::BoxEdges;
    edges.role = QStringLiteral("preview.volume-edges");
    edges.color = intrusion ? INTRUSION_EDGE_COLOR : EXTRUSION_EDGE_COLOR;
    edges.opacity = 1.0;
    edges.lineWidth = 2.0;
    out.append(edges);

    Primitive baseOutline;
    baseOutline.kind = PrimitiveKind::LineSegments;
    baseOutline.role = QStringLiteral("preview.base-outline");
    baseOutline.center = Point3(base.position.x, base.position.y + 0.01, base.position.z);
    baseOutline.vertices = rectangleOutline(base.width, base.height);
    baseOutline.color = settings.intrusionColor;
    baseOutline.opacity = 0.6;
    out.append(baseOutline);

    return out;
}

}  // anonymous namespace

QVector<Primitive> buildPushPullPreview(
    const tools::PushPullTool::State& state,
    const ToolSettings& settings,
    const QVector<model::Layer>& layers)
{
    QVector<Primitive> out = buildPushPullFeedback(state, settings);

    QString layerId;
    if (const auto* hovering = std::get_if<tools::PushPullTool::Hovering>(&state)) {
        layerId = hovering->target.layerId;
    } else if (const auto* drag = std::get_if<tools::PushPullTool::Extruding>(&state)) {
        layerId = drag->target.layerId;
    }

    if (!model::isLayerVisible(layers, layerId)) {
        for (Primitive& p : out) {
            p.opacity *= settings.hiddenLayerOpacity;
        }
    }
    return out;
}

// =====================================================================
//  Active Tool
// =====================================================================

QVector<Primitive> buildToolPreview(const tools::ToolManager& manager)
{
    switch (manager.activeTool()) {
    case tools::ActiveTool::Rectangle:
        return buildRectanglePreview(manager.rectangleTool().state(), manager.settings());
    case tools::ActiveTool::PushPull:
        return buildPushPullPreview(manager.pushPullTool().state(), manager.settings(),
                                    manager.layers());
    case tools::ActiveTool::Select:
    case tools::ActiveTool::None:
        break;
    }
    return {};
}

}  // namespace render
}  // namespace massing
