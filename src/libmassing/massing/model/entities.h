// =====================================================================
//  src/libmassing/massing/model/entities.h — Footprint and volume entities
// =====================================================================
//
//  Immutable value records handed to the host when a drafting gesture
//  commits.  The host owns storage, undo and deletion; the library
//  only creates these records and reads them back for rendering.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_MODEL_ENTITIES_H
#define MASSING_MODEL_ENTITIES_H

#include "../core.h"
#include "../geometry/types.h"
#include "../settings.h"

#include <QColor>
#include <QDateTime>
#include <QString>
#include <QVector>

namespace massing {
namespace model {

/// Layer id used when the host has no layer selected
MASSING_EXPORT extern const char* const DEFAULT_LAYER_ID;

// =====================================================================
//  Rectangle (footprint)
// =====================================================================

/// Rectangular footprint lying flat on the reference plane.
///
/// Corners are stored normalized (startPoint is the min-x/min-z corner,
/// endPoint the max-x/max-z corner), so the click order does not
/// change the record.
struct MASSING_EXPORT Rectangle {
    QString id;                      ///< "rectangle-<uuid>"
    geometry::Point3 startPoint;     ///< Min corner on the plane
    geometry::Point3 endPoint;       ///< Max corner on the plane
    geometry::Point3 position;       ///< Center (lifted by the footprint elevation)
    geometry::Point3 rotation;       ///< Euler angles; always (-pi/2, 0, 0)
    double width = 0.0;              ///< Extent along X
    double height = 0.0;             ///< Extent along Z
    double area = 0.0;
    double perimeter = 0.0;
    QString layerId;
    QDateTime createdAt;
    QColor color;
};

/// Rotation that lays a plane primitive flat on the reference plane
MASSING_EXPORT geometry::Point3 flatRotation();

/// Build a footprint from two corner points on the reference plane.
/// The corner order is irrelevant.  Does not check size thresholds.
/// @param corner1, corner2 Opposite corners
/// @param layerId Owning layer (empty = DEFAULT_LAYER_ID)
/// @param settings Supplies ground height, elevation and color
MASSING_EXPORT Rectangle createRectangle(
    const geometry::Point3& corner1,
    const geometry::Point3& corner2,
    const QString& layerId,
    const ToolSettings& settings = {});

// =====================================================================
//  Extrusion
// =====================================================================

/// Volume derived from exactly one base footprint.  The base is
/// referenced by id and never modified.
struct MASSING_EXPORT Extrusion {
    QString id;                      ///< "extrusion-<uuid>"
    QString baseId;                  ///< Id of the base footprint
    geometry::Point3 position;       ///< Copied from the base center
    geometry::Point3 rotation;       ///< Upright, (0, 0, 0)
    double width = 0.0;              ///< Copied from the base
    double height = 0.0;             ///< Copied from the base (Z extent)
    double depth = 0.0;              ///< |signed height|, never negative
    bool isIntrusion = false;        ///< Signed height was negative
    double volume = 0.0;             ///< width * height * depth
    double baseArea = 0.0;           ///< width * height
    QString layerId;                 ///< Copied from the base
    QDateTime createdAt;
    QColor color;

    /// Depth with the direction applied (negative for intrusions)
    double signedDepth() const { return isIntrusion ? -depth : depth; }
};

/// Build an extrusion of a footprint by a signed height.
/// Does not check the commit threshold.
/// @param base Footprint to extrude (not modified)
/// @param signedHeight Positive = upward, negative = intrusion
/// @param settings Supplies the fallback color
MASSING_EXPORT Extrusion createExtrusion(
    const Rectangle& base,
    double signedHeight,
    const ToolSettings& settings = {});

// =====================================================================
//  Layer
// =====================================================================

/// Layer record consumed for visibility and footprint color
struct MASSING_EXPORT Layer {
    QString id;
    QString name;
    bool visible = true;
    QColor color;       ///< Footprint color; invalid = use the entity's own
};

/// Layer with the given id, or nullptr
MASSING_EXPORT const Layer* findLayer(const QVector<Layer>& layers, const QString& layerId);

/// Visibility of a layer; unknown ids count as visible
MASSING_EXPORT bool isLayerVisible(const QVector<Layer>& layers, const QString& layerId);

}  // namespace model
}  // namespace massing

#endif  // MASSING_MODEL_ENTITIES_H
