// =====================================================================
//  src/libmassing/render/importrenderer.cpp — Imported drawing geometry
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/render/importrenderer.h>

namespace massing {
namespace render {

using geometry::Point3;

namespace {

constexpr double LINE_WIDTH = 2.0;
constexpr double POLYLINE_WIDTH = 1.5;

/// Expand a point chain into vertex pairs
QVector<Point3> chainToSegments(const QVector<Point3>& chain)
{
    QVector<Point3> segments;
    segments.reserve(qMax(0, (chain.size() - 1) * 2));
    for (int i = 1; i < chain.size(); ++i) {
        segments.append(chain[i - 1]);
        segments.append(chain[i]);
    }
    return segments;
}

Primitive makeLinework(const io::DXFEntity& entity, const QString& role, double lineWidth)
{
    Primitive p;
    p.kind = PrimitiveKind::LineSegments;
    p.role = role;
    p.center = Point3(0.0, IMPORT_LIFT, 0.0);
    p.color = entity.color.isValid() ? entity.color : QColor(0, 0, 0);
    p.lineWidth = lineWidth;
    return p;
}

}  // anonymous namespace

QVector<Primitive> buildImportEntityPrimitives(const io::DXFEntity& entity, const ToolSettings& settings)
{
    QVector<Primitive> out;

    switch (entity.type) {
    case io::EntityType::Line:
    case io::EntityType::Polyline: {
        if (entity.points.size() < 2) {
            break;
        }
        const bool line = entity.type == io::EntityType::Line;
        Primitive p = makeLinework(entity,
                                   line ? QStringLiteral("import.line") : QStringLiteral("import.polyline"),
                                   line ? LINE_WIDTH : POLYLINE_WIDTH);
        p.vertices = chainToSegments(entity.points);
        out.append(p);
        break;
    }
    case io::EntityType::Circle: {
        const QVector<Point3> outline = io::tessellateCircle(entity, settings.circleSegments);
        if (outline.isEmpty()) {
            break;
        }
        Primitive p = makeLinework(entity, QStringLiteral("import.circle"), POLYLINE_WIDTH);
        p.vertices = chainToSegments(outline);
        out.append(p);
        break;
    }
    case io::EntityType::Other:
        break;
    }

    return out;
}

QVector<Primitive> buildImportPrimitives(const QVector<io::DXFEntity>& entities, const ToolSettings& settings)
{
    QVector<Primitive> out;
    for (const io::DXFEntity& entity : entities) {
        out += buildImportEntityPrimitives(entity, settings);
    }
    return out;
}

}  // namespace render
}  // namespace massing
