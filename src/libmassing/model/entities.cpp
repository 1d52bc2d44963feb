// =====================================================================
//  src/libmassing/model/entities.cpp — Footprint and volume entities
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/model/entities.h>

#include <QUuid>
#include <QtMath>

namespace massing {
namespace model {

using geometry::Point3;

const char* const DEFAULT_LAYER_ID = "default";

namespace {

QString makeId(const char* prefix)
{
    return QStringLiteral("%1-%2")
        .arg(QLatin1String(prefix), QUuid::createUuid().toString(QUuid::WithoutBraces));
}

}  // anonymous namespace

// =====================================================================
//  Rectangle
// =====================================================================

Point3 flatRotation()
{
    return Point3(-M_PI / 2.0, 0.0, 0.0);
}

Rectangle createRectangle(
    const Point3& corner1,
    const Point3& corner2,
    const QString& layerId,
    const ToolSettings& settings)
{
    const double minX = qMin(corner1.x, corner2.x);
    const double maxX = qMax(corner1.x, corner2.x);
    const double minZ = qMin(corner1.z, corner2.z);
    const double maxZ = qMax(corner1.z, corner2.z);

    Rectangle rect;
    rect.id = makeId("rectangle");
    rect.startPoint = Point3(minX, settings.groundHeight, minZ);
    rect.endPoint = Point3(maxX, settings.groundHeight, maxZ);
    rect.position = Point3((minX + maxX) / 2.0,
                           settings.groundHeight + settings.footprintElevation,
                           (minZ + maxZ) / 2.0);
    rect.rotation = flatRotation();
    rect.width = maxX - minX;
    rect.height = maxZ - minZ;
    rect.area = rect.width * rect.height;
    rect.perimeter = 2.0 * (rect.width + rect.height);
    rect.layerId = layerId.isEmpty() ? QString::fromLatin1(DEFAULT_LAYER_ID) : layerId;
    rect.createdAt = QDateTime::currentDateTime();
    rect.color = settings.defaultFootprintColor;
    return rect;
}

// =====================================================================
//  Extrusion
// =====================================================================

Extrusion createExtrusion(
    const Rectangle& base,
    double signedHeight,
    const ToolSettings& settings)
{
    Extrusion ext;
    ext.id = makeId("extrusion");
    ext.baseId = base.id;
    ext.position = base.position;
    ext.rotation = Point3();
    ext.width = base.width;
    ext.height = base.height;
    ext.depth = qAbs(signedHeight);
    ext.isIntrusion = signedHeight < 0.0;
    ext.baseArea = base.width * base.height;
    ext.volume = ext.baseArea * ext.depth;
    ext.layerId = base.layerId;
    ext.createdAt = QDateTime::currentDateTime();
    ext.color = base.color.isValid() ? base.color : settings.defaultFootprintColor;
    return ext;
}

// =====================================================================
//  Layer
// =====================================================================

const Layer* findLayer(const QVector<Layer>& layers, const QString& layerId)
{
    for (const Layer& layer : layers) {
        if (layer.id == layerId) {
            return &layer;
        }
    }
    return nullptr;
}

bool isLayerVisible(const QVector<Layer>& layers, const QString& layerId)
{
    const Layer* layer = findLayer(layers, layerId);
    return layer ? layer->visible : true;
}

}  // namespace model
}  // namespace massing
