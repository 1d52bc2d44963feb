// =====================================================================
//  src/libmassing/massing/render/importrenderer.h — Imported drawing geometry
// =====================================================================
//
//  Pure mapping from imported CAD entities to line draw commands laid
//  just above the ground plane.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_RENDER_IMPORTRENDERER_H
#define MASSING_RENDER_IMPORTRENDERER_H

#include "primitives.h"
#include "../io/cadimport.h"
#include "../settings.h"

#include <QVector>

namespace massing {
namespace render {

/// Height above the ground plane at which imported linework is drawn
constexpr double IMPORT_LIFT = 0.01;

/// Line segments for one imported entity, in the entity's color.
///   - LINE: the point chain, line width 2
///   - POLYLINE: the point chain, line width 1.5
///   - CIRCLE: settings.circleSegments outline, line width 1.5
/// Lines and polylines with fewer than two points, and any other
/// record type, produce nothing.
MASSING_EXPORT QVector<Primitive> buildImportEntityPrimitives(
    const io::DXFEntity& entity,
    const ToolSettings& settings = {});

/// Line segments for a whole imported drawing, in entity order
MASSING_EXPORT QVector<Primitive> buildImportPrimitives(
    const QVector<io::DXFEntity>& entities,
    const ToolSettings& settings = {});

}  // namespace render
}  // namespace massing

#endif  // MASSING_RENDER_IMPORTRENDERER_H
