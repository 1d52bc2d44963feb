// =====================================================================
//  src/libmassing/massing/tools/pushpulltool.h — Footprint extrusion tool
// =====================================================================
//
//  Hover/drag state machine that turns a committed footprint into an
//  Extrusion:
//
//      Idle <--hover--> Hovering --click--> Extruding --click--> (commit) Idle
//                                           Extruding --cancel--> Idle
//
//  While extruding, vertical pointer travel maps to a signed height:
//  up on screen is positive (extrusion), down is negative (intrusion).
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_TOOLS_PUSHPULLTOOL_H
#define MASSING_TOOLS_PUSHPULLTOOL_H

#include "tooltypes.h"
#include "../settings.h"

#include <QVector>

#include <optional>
#include <variant>

namespace massing {
namespace tools {

class MASSING_EXPORT PushPullTool {
public:
    /// Nothing under the cursor
    struct Idle {};

    /// Cursor over a footprint
    struct Hovering {
        model::Rectangle target;
    };

    /// Dragging the height of a footprint
    struct Extruding {
        model::Rectangle target;
        double dragStartY = 0.0;    ///< Screen Y at the starting click
        double height = 0.0;        ///< Current signed height
    };

    using State = std::variant<Idle, Hovering, Extruding>;

    explicit PushPullTool(const ToolSettings& settings = {});

    void setCallbacks(const ToolCallbacks& callbacks) { m_callbacks = callbacks; }
    void setSettings(const ToolSettings& settings) { m_settings = settings; }
    const ToolSettings& settings() const { return m_settings; }

    /// Candidate footprints for hover and extrusion.
    /// A hovered or dragged footprint is refreshed from the new list;
    /// if it is no longer present the hover is dropped and a drag discarded.
    void setFootprints(const QVector<model::Rectangle>& footprints);
    const QVector<model::Rectangle>& footprints() const { return m_footprints; }

    void pointerMove(const PointerEvent& event);
    void pointerClick(const PointerEvent& event);

    /// Abandon an in-progress extrusion.
    /// @return true if an extrusion was discarded
    bool cancel();

    /// Leave the tool: discard any drag and forget the hovered footprint
    void deactivate();

    const State& state() const { return m_state; }
    bool isExtruding() const { return std::holds_alternative<Extruding>(m_state); }

    /// Footprint currently under the cursor (empty while extruding)
    std::optional<model::Rectangle> hovered() const;

    /// Values of the current drag (empty unless extruding)
    std::optional<ExtrusionMeasurements> liveMeasurements() const;

    /// Nearest footprint hit by a ray, if any
    std::optional<model::Rectangle> pick(const geometry::Ray& ray) const;

private:
    const model::Rectangle* findFootprint(const QString& id) const;
    void updateHover(const PointerEvent& event);
    void finishExtrusion();
    void emitMeasurements(const Extruding& drag) const;
    void emitCleared() const;

    ToolSettings m_settings;
    ToolCallbacks m_callbacks;
    QVector<model::Rectangle> m_footprints;
    State m_state;
};

/// Measurements for a footprint extruded by a signed height
MASSING_EXPORT ExtrusionMeasurements measureExtrusion(
    const model::Rectangle& base, double signedHeight);

}  // namespace tools
}  // namespace massing

#endif  // MASSING_TOOLS_PUSHPULLTOOL_H
