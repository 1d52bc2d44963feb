// =====================================================================
//  src/libmassing/settings.cpp — Tool and renderer settings
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/settings.h>

#include <QLoggingCategory>
#include <QSettings>

namespace massing {

Q_LOGGING_CATEGORY(logSettings, "massing.settings")

namespace {

/// Read a double that must be >= minimum (or > minimum when strict)
double readDouble(QSettings& s, const QString& key, double fallback,
                  double minimum, bool strict = false)
{
    if (!s.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const double value = s.value(key).toDouble(&ok);
    const bool inRange = strict ? value > minimum : value >= minimum;
    if (!ok || !inRange) {
        qCWarning(logSettings) << "loadToolSettings:rejected" << key
                               << "value" << s.value(key).toString();
        return fallback;
    }
    return value;
}

QColor readColor(QSettings& s, const QString& key, const QColor& fallback)
{
    if (!s.contains(key)) {
        return fallback;
    }

    const QColor color(s.value(key).toString());
    if (!color.isValid()) {
        qCWarning(logSettings) << "loadToolSettings:rejected" << key
                               << "value" << s.value(key).toString();
        return fallback;
    }
    return color;
}

}  // anonymous namespace

ToolSettings loadToolSettings(QSettings& store)
{
    ToolSettings d;
    ToolSettings result;

    store.beginGroup(QStringLiteral("tools"));

    // Ground height may be any finite value
    if (store.contains(QStringLiteral("groundHeight"))) {
        bool ok = false;
        const double h = store.value(QStringLiteral("groundHeight")).toDouble(&ok);
        if (ok) {
            result.groundHeight = h;
        } else {
            qCWarning(logSettings) << "loadToolSettings:rejected groundHeight";
        }
    }

    result.parallelTolerance = readDouble(store, QStringLiteral("parallelTolerance"),
                                          d.parallelTolerance, 0.0, true);
    result.minimumRectangleDistance = readDouble(store, QStringLiteral("minimumRectangleDistance"),
                                                 d.minimumRectangleDistance, 0.0);
    result.minimumRectangleSize = readDouble(store, QStringLiteral("minimumRectangleSize"),
                                             d.minimumRectangleSize, 0.0);
    result.footprintElevation = readDouble(store, QStringLiteral("footprintElevation"),
                                           d.footprintElevation, 0.0);
    result.pushPullSensitivity = readDouble(store, QStringLiteral("pushPullSensitivity"),
                                            d.pushPullSensitivity, 0.0, true);
    result.minimumExtrusionHeight = readDouble(store, QStringLiteral("minimumExtrusionHeight"),
                                               d.minimumExtrusionHeight, 0.0);
    result.hiddenLayerOpacity = readDouble(store, QStringLiteral("hiddenLayerOpacity"),
                                           d.hiddenLayerOpacity, 0.0);
    if (result.hiddenLayerOpacity > 1.0) {
        qCWarning(logSettings) << "loadToolSettings:rejected hiddenLayerOpacity"
                               << result.hiddenLayerOpacity;
        result.hiddenLayerOpacity = d.hiddenLayerOpacity;
    }

    result.highlightColor = readColor(store, QStringLiteral("highlightColor"), d.highlightColor);
    result.defaultFootprintColor = readColor(store, QStringLiteral("defaultFootprintColor"),
                                             d.defaultFootprintColor);
    result.intrusionColor = readColor(store, QStringLiteral("intrusionColor"), d.intrusionColor);

    result.importTargetSize = readDouble(store, QStringLiteral("importTargetSize"),
                                         d.importTargetSize, 0.0, true);

    if (store.contains(QStringLiteral("circleSegments"))) {
        bool ok = false;
        const int segments = store.value(QStringLiteral("circleSegments")).toInt(&ok);
        if (ok && segments >= 3) {
            result.circleSegments = segments;
        } else {
            qCWarning(logSettings) << "loadToolSettings:rejected circleSegments"
                                   << store.value(QStringLiteral("circleSegments")).toString();
        }
    }

    store.endGroup();
    return result;
}

void saveToolSettings(QSettings& store, const ToolSettings& settings)
{
    store.beginGroup(QStringLiteral("tools"));

    store.setValue(QStringLiteral("groundHeight"), settings.groundHeight);
    store.setValue(QStringLiteral("parallelTolerance"), settings.parallelTolerance);
    store.setValue(QStringLiteral("minimumRectangleDistance"), settings.minimumRectangleDistance);
    store.setValue(QStringLiteral("minimumRectangleSize"), settings.minimumRectangleSize);
    store.setValue(QStringLiteral("footprintElevation"), settings.footprintElevation);
    store.setValue(QStringLiteral("pushPullSensitivity"), settings.pushPullSensitivity);
    store.setValue(QStringLiteral("minimumExtrusionHeight"), settings.minimumExtrusionHeight);
    store.setValue(QStringLiteral("hiddenLayerOpacity"), settings.hiddenLayerOpacity);
    store.setValue(QStringLiteral("highlightColor"), settings.highlightColor.name());
    store.setValue(QStringLiteral("defaultFootprintColor"), settings.defaultFootprintColor.name());
    store.setValue(QStringLiteral("intrusionColor"), settings.intrusionColor.name());
    store.setValue(QStringLiteral("importTargetSize"), settings.importTargetSize);
    store.setValue(QStringLiteral("circleSegments"), settings.circleSegments);

    store.endGroup();
}

}  // namespace massing
