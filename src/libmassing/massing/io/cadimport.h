// =====================================================================
//  src/libmassing/massing/io/cadimport.h — CAD interchange (DXF) import
// =====================================================================
//
//  Minimal reader for the group-code text format used by DXF files.
//  Only LINE, POLYLINE and CIRCLE records in the ENTITIES section are
//  interpreted; other entity types pass through with their type name.
//
//  Coordinates are mapped onto the scene's horizontal plane: source X
//  stays X, source Y becomes the negated scene Z, and scene Y is 0.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_IO_CADIMPORT_H
#define MASSING_IO_CADIMPORT_H

#include "../core.h"
#include "../geometry/types.h"

#include <QByteArray>
#include <QColor>
#include <QString>
#include <QStringList>
#include <QVector>

namespace massing {
namespace io {

// =====================================================================
//  Entities
// =====================================================================

/// Entity kinds recognized by the reader
enum class EntityType {
    Line,
    Polyline,
    Circle,
    Other       ///< Any other record; see DXFEntity::typeName
};

/// Radius of a CIRCLE record that carries no group code 40
constexpr double DEFAULT_CIRCLE_RADIUS = 1.0;

/// One drawable record read from the ENTITIES section
struct MASSING_EXPORT DXFEntity {
    EntityType type = EntityType::Other;
    QString typeName;                       ///< Record name as written ("LINE", "ARC", ...)
    QVector<geometry::Point3> points;       ///< Vertices; a CIRCLE holds its center only
    QColor color = QColor(0, 0, 0);
    QString layer = QStringLiteral("0");
    double radius = 0.0;                    ///< CIRCLE radius (group code 40, else DEFAULT_CIRCLE_RADIUS)
};

/// Map a record name to its entity type
MASSING_EXPORT EntityType entityTypeFromName(const QString& name);

/// Color for a color index (group code 62).  Indices 0-9 map to
/// black, red, yellow, green, cyan, blue, magenta, white, gray and
/// silver; anything else is black.
MASSING_EXPORT QColor colorFromIndex(int index);

// =====================================================================
//  Import
// =====================================================================

/// Result of an import.  On failure the entity list is empty.
struct MASSING_EXPORT CADImportResult {
    bool success = false;
    QVector<DXFEntity> entities;
    geometry::BoundingBox3 bounds;          ///< Over every point; empty box when none
    QStringList layers;                     ///< Layer names in first-seen order
    QString errorMessage;
};

/// Parse decoded interchange text.  Never fails: malformed pairs and
/// unknown group codes are skipped.
MASSING_EXPORT CADImportResult importCADString(const QString& text);

/// Decode UTF-8 bytes and parse them.  Invalid UTF-8 is an error.
MASSING_EXPORT CADImportResult importCAD(const QByteArray& data);

/// Read and parse a file.  An unreadable file is an error.
MASSING_EXPORT CADImportResult importCADFile(const QString& filePath);

// =====================================================================
//  Post-processing
// =====================================================================

/// Axis-aligned bounds over every point of every entity
MASSING_EXPORT geometry::BoundingBox3 entityBounds(const QVector<DXFEntity>& entities);

/// Outline points of a CIRCLE on the horizontal plane.
/// @param entity CIRCLE record (center point + radius)
/// @param segments Number of segments (at least 3)
/// @return segments + 1 points, first == last; empty for non-circles
MASSING_EXPORT QVector<geometry::Point3> tessellateCircle(const DXFEntity& entity, int segments = 32);

/// Recenter a drawing on the scene origin (X/Z) and rescale it when
/// its largest horizontal extent is above 2 * targetSize or below 1.
/// @param entities Parsed entities
/// @param targetSize Largest extent after scaling
/// @return Transformed copy; empty input is returned unchanged
MASSING_EXPORT QVector<DXFEntity> fitToScene(const QVector<DXFEntity>& entities, double targetSize = 20.0);

}  // namespace io
}  // namespace massing

#endif  // MASSING_IO_CADIMPORT_H
