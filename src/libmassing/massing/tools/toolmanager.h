// =====================================================================
//  src/libmassing/massing/tools/toolmanager.h — Active tool routing
// =====================================================================
//
//  Owns the drafting tools and routes host input to whichever one the
//  host has made active.  Switching tools cancels the gesture of the
//  tool being left.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_TOOLS_TOOLMANAGER_H
#define MASSING_TOOLS_TOOLMANAGER_H

#include "pushpulltool.h"
#include "rectangletool.h"

#include <QString>
#include <QVector>

namespace massing {
namespace tools {

class MASSING_EXPORT ToolManager {
public:
    explicit ToolManager(const ToolSettings& settings = {});

    void setCallbacks(const ToolCallbacks& callbacks);
    void setSettings(const ToolSettings& settings);
    const ToolSettings& settings() const { return m_settings; }

    // ---- Active tool ----

    void setActiveTool(ActiveTool tool);

    /// Select by host identifier; unknown identifiers leave no live tool
    void setActiveTool(const QString& id) { setActiveTool(toolFromId(id)); }

    ActiveTool activeTool() const { return m_active; }

    // ---- Host scene state ----

    void setFootprints(const QVector<model::Rectangle>& footprints);
    const QVector<model::Rectangle>& footprints() const { return m_pushPull.footprints(); }

    void setLayers(const QVector<model::Layer>& layers) { m_layers = layers; }
    const QVector<model::Layer>& layers() const { return m_layers; }

    void setSelectedLayerId(const QString& layerId);
    QString selectedLayerId() const { return m_rectangle.selectedLayerId(); }

    // ---- Input ----

    void pointerMove(const PointerEvent& event);
    void pointerClick(const PointerEvent& event);

    /// Cancel signal (e.g. Escape).  No-op unless a gesture is in progress.
    /// @return true if a gesture was discarded
    bool cancel();

    /// True while the live tool has a gesture in progress
    bool isBusy() const;

    // ---- Tool access (for preview rendering) ----

    const RectangleTool& rectangleTool() const { return m_rectangle; }
    const PushPullTool& pushPullTool() const { return m_pushPull; }

private:
    ToolSettings m_settings;
    ActiveTool m_active = ActiveTool::Select;
    RectangleTool m_rectangle;
    PushPullTool m_pushPull;
    QVector<model::Layer> m_layers;
};

}  // namespace tools
}  // namespace massing

#endif  // MASSING_TOOLS_TOOLMANAGER_H
