// =====================================================================
//  src/libmassing/massing/render/toolpreview.h — In-progress gesture geometry
// =====================================================================
//
//  Pure projection of tool state snapshots into draw commands.  The
//  tools never describe geometry themselves.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_RENDER_TOOLPREVIEW_H
#define MASSING_RENDER_TOOLPREVIEW_H

#include "primitives.h"
#include "../tools/pushpulltool.h"
#include "../tools/rectangletool.h"

#include <QVector>

namespace massing {

namespace tools {
class ToolManager;
}

namespace render {

/// Rectangle draft feedback: cursor ring while idle, start marker while
/// drafting, translucent plane and outline once the preview is visible
MASSING_EXPORT QVector<Primitive> buildRectanglePreview(
    const tools::RectangleTool::State& state,
    const ToolSettings& settings = {});

/// Push/pull feedback: overlay on the hovered footprint, or the live
/// volume centered at base.y + height / 2 while extruding.
/// Feedback on a footprint whose layer is hidden is dimmed by
/// settings.hiddenLayerOpacity.
MASSING_EXPORT QVector<Primitive> buildPushPullPreview(
    const tools::PushPullTool::State& state,
    const ToolSettings& settings = {},
    const QVector<model::Layer>& layers = {});

/// Preview for whichever tool the manager has live, using its layers
MASSING_EXPORT QVector<Primitive> buildToolPreview(const tools::ToolManager& manager);

}  // namespace render
}  // namespace massing

#endif  // MASSING_RENDER_TOOLPREVIEW_H
