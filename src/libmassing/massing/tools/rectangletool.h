// =====================================================================
//  src/libmassing/massing/tools/rectangletool.h — Two-click footprint tool
// =====================================================================
//
//  State machine for drafting a rectangular footprint on the reference
//  plane:
//
//      Idle --click on ground--> Drafting --click--> (commit) Idle
//                                 Drafting --cancel--> Idle
//
//  The host feeds pointer samples and the cancel signal; the tool
//  reports through ToolCallbacks and exposes its state for preview
//  rendering (see render/toolpreview.h).
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_TOOLS_RECTANGLETOOL_H
#define MASSING_TOOLS_RECTANGLETOOL_H

#include "tooltypes.h"
#include "../settings.h"

#include <QString>

#include <optional>
#include <variant>

namespace massing {
namespace tools {

class MASSING_EXPORT RectangleTool {
public:
    /// Waiting for the first corner
    struct Idle {
        std::optional<geometry::Point3> hoverPoint;   ///< Ground point under the cursor
    };

    /// First corner placed, following the pointer
    struct Drafting {
        geometry::Point3 start;
        geometry::Point3 current;
        bool previewVisible = false;    ///< Pointer has travelled the preview distance
    };

    using State = std::variant<Idle, Drafting>;

    explicit RectangleTool(const ToolSettings& settings = {});

    void setCallbacks(const ToolCallbacks& callbacks) { m_callbacks = callbacks; }
    void setSettings(const ToolSettings& settings) { m_settings = settings; }
    const ToolSettings& settings() const { return m_settings; }

    /// Layer assigned to new footprints (empty = default layer)
    void setSelectedLayerId(const QString& layerId) { m_layerId = layerId; }
    QString selectedLayerId() const { return m_layerId; }

    void pointerMove(const PointerEvent& event);
    void pointerClick(const PointerEvent& event);

    /// Abandon an in-progress draft.
    /// @return true if a draft was discarded, false if the tool was idle
    bool cancel();

    /// Leave the tool: discard any draft and forget the hover point
    void deactivate();

    const State& state() const { return m_state; }
    bool isDrafting() const { return std::holds_alternative<Drafting>(m_state); }

    /// Dimensions of the current draft (empty when idle)
    std::optional<RectangleMeasurements> liveMeasurements() const;

private:
    std::optional<geometry::Point3> groundPoint(const PointerEvent& event) const;
    void finishDraft(geometry::Point3 end);
    void resetToIdle();
    void emitMeasurements(const Drafting& draft) const;
    void emitCleared() const;

    ToolSettings m_settings;
    ToolCallbacks m_callbacks;
    QString m_layerId;
    State m_state;
};

/// Measurements for a draft between two ground points
MASSING_EXPORT RectangleMeasurements measureRectangle(
    const geometry::Point3& start, const geometry::Point3& end);

}  // namespace tools
}  // namespace massing

#endif  // MASSING_TOOLS_RECTANGLETOOL_H
