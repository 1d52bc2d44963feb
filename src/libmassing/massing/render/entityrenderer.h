// =====================================================================
//  src/libmassing/massing/render/entityrenderer.h — Committed entity geometry
// =====================================================================
//
//  Pure mapping from committed footprints and extrusions, plus the
//  selection and layer state, to draw commands.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_RENDER_ENTITYRENDERER_H
#define MASSING_RENDER_ENTITYRENDERER_H

#include "primitives.h"
#include "../model/entities.h"
#include "../settings.h"

#include <QString>
#include <QVector>

namespace massing {
namespace render {

// =====================================================================
//  Extrusions
// =====================================================================

/// Fill color of an extrusion.  Selection wins over everything, then
/// intrusions are red, otherwise the entity's own color.
MASSING_EXPORT QColor extrusionColor(
    const model::Extrusion& extrusion,
    bool selected,
    const ToolSettings& settings = {});

/// World-space box occupied by an extrusion (above the footprint for
/// extrusions, below it for intrusions)
MASSING_EXPORT geometry::BoundingBox3 extrusionBounds(const model::Extrusion& extrusion);

/// Draw commands for one extrusion: solid box and its edges, plus base
/// outline, top outline and four corner segments when selected.
/// Entities on hidden layers are drawn at reduced opacity.
/// @param extrusion Entity to draw
/// @param selectedId Id of the selected entity (may be empty)
/// @param layers Layer list for visibility
MASSING_EXPORT QVector<Primitive> buildExtrusionPrimitives(
    const model::Extrusion& extrusion,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings = {});

// =====================================================================
//  Footprints
// =====================================================================

/// Draw commands for one footprint: flat plane and outline, plus a
/// halo and start/end/center markers when selected.  Footprints on
/// hidden layers produce nothing.
MASSING_EXPORT QVector<Primitive> buildRectanglePrimitives(
    const model::Rectangle& rectangle,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings = {});

// =====================================================================
//  Scene
// =====================================================================

/// Draw commands for every committed entity, footprints first
MASSING_EXPORT QVector<Primitive> buildScenePrimitives(
    const QVector<model::Rectangle>& rectangles,
    const QVector<model::Extrusion>& extrusions,
    const QString& selectedId,
    const QVector<model::Layer>& layers,
    const ToolSettings& settings = {});

}  // namespace render
}  // namespace massing

#endif  // MASSING_RENDER_ENTITYRENDERER_H
