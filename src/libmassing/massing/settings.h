// =====================================================================
//  src/libmassing/massing/settings.h — Tool and renderer settings
// =====================================================================
//
//  Tunable thresholds, sensitivities and colors shared by the drafting
//  tools, the renderers and the import helpers.  Defaults match the
//  interactive behavior hosts expect; a host may persist overrides in
//  its QSettings store under the "tools" group.
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_SETTINGS_H
#define MASSING_SETTINGS_H

#include "core.h"

#include <QColor>

class QSettings;

namespace massing {

/// Settings consumed by tools, renderers and import helpers
struct MASSING_EXPORT ToolSettings {
    // ---- Ray / plane ----
    double groundHeight = 0.0;              ///< Reference plane height
    double parallelTolerance = 1e-6;        ///< |dir.y| below this = parallel

    // ---- Rectangle draft ----
    double minimumRectangleDistance = 0.1;  ///< Pointer travel before the preview shows
    double minimumRectangleSize = 0.1;      ///< Width and height must exceed this to commit
    double footprintElevation = 0.01;       ///< Committed footprints sit this far above the plane

    // ---- Push/pull ----
    double pushPullSensitivity = 0.05;      ///< Height units per screen pixel
    double minimumExtrusionHeight = 0.05;   ///< |height| must exceed this to commit

    // ---- Rendering ----
    double hiddenLayerOpacity = 0.3;        ///< Opacity for entities on hidden layers
    QColor highlightColor = QColor(0xff, 0x6b, 0x6b);
    QColor defaultFootprintColor = QColor(0x3b, 0x82, 0xf6);
    QColor intrusionColor = QColor(0xef, 0x44, 0x44);

    // ---- Import ----
    double importTargetSize = 20.0;         ///< Largest extent after fitToScene()
    int circleSegments = 32;                ///< Outline segments for tessellated circles
};

/// Read settings from the "tools" group of a QSettings store.
/// Missing keys keep their defaults; invalid values (negative thresholds,
/// non-positive sensitivity, bad colors) are rejected with a warning.
MASSING_EXPORT ToolSettings loadToolSettings(QSettings& store);

/// Write settings to the "tools" group of a QSettings store.
MASSING_EXPORT void saveToolSettings(QSettings& store, const ToolSettings& settings);

}  // namespace massing

#endif  // MASSING_SETTINGS_H
