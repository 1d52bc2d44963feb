// =====================================================================
//  src/libmassing/tools/tooltypes.cpp — Shared drafting tool types
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/tools/tooltypes.h>

namespace massing {
namespace tools {

QString toolId(ActiveTool tool)
{
    switch (tool) {
    case ActiveTool::Select:    return QStringLiteral("select");
    case ActiveTool::Rectangle: return QStringLiteral("rectangle");
    case ActiveTool::PushPull:  return QStringLiteral("push-pull");
    case ActiveTool::None:      break;
    }
    return QString();
}

ActiveTool toolFromId(const QString& id)
{
    if (id == QLatin1String("select"))    return ActiveTool::Select;
    if (id == QLatin1String("rectangle")) return ActiveTool::Rectangle;
    if (id == QLatin1String("push-pull")) return ActiveTool::PushPull;
    return ActiveTool::None;
}

namespace {

QString fixed3(double value)
{
    return QString::number(value, 'f', 3);
}

}  // anonymous namespace

QVariantMap formatMeasurements(const Measurements& measurements)
{
    QVariantMap map;

    if (const auto* rect = std::get_if<RectangleMeasurements>(&measurements)) {
        map.insert(QStringLiteral("width"), fixed3(rect->width));
        map.insert(QStringLiteral("height"), fixed3(rect->height));
        map.insert(QStringLiteral("area"), fixed3(rect->area));
        map.insert(QStringLiteral("perimeter"), fixed3(rect->perimeter));
    } else if (const auto* ext = std::get_if<ExtrusionMeasurements>(&measurements)) {
        map.insert(QStringLiteral("height"), fixed3(ext->height));
        map.insert(QStringLiteral("volume"), fixed3(ext->volume));
        map.insert(QStringLiteral("baseArea"), fixed3(ext->baseArea));
    }

    return map;
}

}  // namespace tools
}  // namespace massing
