// =====================================================================
//  src/libmassing/massing/tools/tooltypes.h — Shared drafting tool types
// =====================================================================
//
//  Tool identifiers, pointer input, measurement payloads and the
//  callback set through which the drafting tools report to the host.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_TOOLS_TOOLTYPES_H
#define MASSING_TOOLS_TOOLTYPES_H

#include "../core.h"
#include "../geometry/types.h"
#include "../model/entities.h"

#include <QPointF>
#include <QString>
#include <QVariantMap>

#include <functional>
#include <optional>
#include <variant>

namespace massing {
namespace tools {

// =====================================================================
//  Tool Identifiers
// =====================================================================

/// Tool selected by the host
enum class ActiveTool {
    None,       ///< No live tool (unknown identifier)
    Select,     ///< "select"
    Rectangle,  ///< "rectangle"
    PushPull    ///< "push-pull"
};

/// Host-facing identifier ("select", "rectangle", "push-pull", "" for None)
MASSING_EXPORT QString toolId(ActiveTool tool);

/// Parse a host identifier; anything unrecognized is ActiveTool::None
MASSING_EXPORT ActiveTool toolFromId(const QString& id);

// =====================================================================
//  Pointer Input
// =====================================================================

/// One pointer sample as seen by a tool.  The ray is empty when the
/// host could not build one (e.g. degenerate camera).
struct MASSING_EXPORT PointerEvent {
    QPointF screenPos;                   ///< Pixels, Y down
    std::optional<geometry::Ray> ray;    ///< Picking ray through screenPos

    PointerEvent() = default;
    PointerEvent(const QPointF& pos, const geometry::Ray& r) : screenPos(pos), ray(r) {}
};

// =====================================================================
//  Measurements
// =====================================================================

/// Live dimensions of an in-progress footprint
struct MASSING_EXPORT RectangleMeasurements {
    double width = 0.0;
    double height = 0.0;
    double area = 0.0;
    double perimeter = 0.0;
};

/// Live values of an in-progress extrusion
struct MASSING_EXPORT ExtrusionMeasurements {
    double height = 0.0;     ///< Signed height
    double volume = 0.0;     ///< Signed: base width * base height * height
    double baseArea = 0.0;
};

using Measurements = std::variant<RectangleMeasurements, ExtrusionMeasurements>;

/// Broadcast sent while a gesture is live (isDrawing, with measurements)
/// and once when it ends (not drawing, no measurements)
struct MASSING_EXPORT MeasurementUpdate {
    bool isDrawing = false;
    ActiveTool activeTool = ActiveTool::None;
    std::optional<Measurements> measurements;
};

/// Format measurements as strings with three decimals, keyed by
/// width/height/area/perimeter or height/volume/baseArea
MASSING_EXPORT QVariantMap formatMeasurements(const Measurements& measurements);

// =====================================================================
//  Callbacks
// =====================================================================

/// Host callbacks.  Unset callbacks are skipped.
struct MASSING_EXPORT ToolCallbacks {
    std::function<void(const model::Rectangle&)> onRectangleCreate;
    std::function<void(const model::Extrusion&)> onExtrusionCreate;
    std::function<void(const MeasurementUpdate&)> onMeasurementUpdate;
};

}  // namespace tools
}  // namespace massing

#endif  // MASSING_TOOLS_TOOLTYPES_H
