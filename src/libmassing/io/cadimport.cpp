// =====================================================================
//  src/libmassing/io/cadimport.cpp — CAD interchange (DXF) import
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/io/cadimport.h>

#include <QFile>
#include <QLoggingCategory>
#include <QStringDecoder>
#include <QtMath>

#include <cmath>
#include <optional>

namespace massing {
namespace io {

Q_LOGGING_CATEGORY(logCadImport, "massing.io.cadimport")

using geometry::BoundingBox3;
using geometry::Point3;

// =====================================================================
//  Entity helpers
// =====================================================================

EntityType entityTypeFromName(const QString& name)
{
    if (name == QLatin1String("LINE"))     return EntityType::Line;
    if (name == QLatin1String("POLYLINE")) return EntityType::Polyline;
    if (name == QLatin1String("CIRCLE"))   return EntityType::Circle;
    return EntityType::Other;
}

QColor colorFromIndex(int index)
{
    static const QRgb palette[] = {
        0x000000,   // 0 black
        0xFF0000,   // 1 red
        0xFFFF00,   // 2 yellow
        0x00FF00,   // 3 green
        0x00FFFF,   // 4 cyan
        0x0000FF,   // 5 blue
        0xFF00FF,   // 6 magenta
        0xFFFFFF,   // 7 white
        0x808080,   // 8 gray
        0xC0C0C0    // 9 silver
    };
    constexpr int paletteSize = int(sizeof(palette) / sizeof(palette[0]));

    if (index < 0 || index >= paletteSize) {
        return QColor(palette[0]);
    }
    return QColor(palette[index]);
}

// =====================================================================
//  Parser
// =====================================================================

namespace {

/// Trimmed line, or an empty string past the end
QString lineAt(const QStringList& lines, int index)
{
    if (index < 0 || index >= lines.size()) {
        return QString();
    }
    return lines[index].trimmed();
}

/// Ordinate carried by the value line at index; 0 when missing or unreadable
double ordinateAt(const QStringList& lines, int index)
{
    bool ok = false;
    const double value = lineAt(lines, index).toDouble(&ok);
    return ok ? value : 0.0;
}

/// Accumulates records for one parse pass
class EntityCollector {
public:
    void begin(const QString& typeName)
    {
        finish();
        DXFEntity entity;
        entity.typeName = typeName;
        entity.type = entityTypeFromName(typeName);
        if (entity.type == EntityType::Circle) {
            entity.radius = DEFAULT_CIRCLE_RADIUS;
        }
        m_current = entity;
    }

    std::optional<DXFEntity>& current() { return m_current; }

    /// Keep the open record if it has a type and at least one point
    void finish()
    {
        if (!m_current) {
            return;
        }
        if (!m_current->typeName.isEmpty() && !m_current->points.isEmpty()) {
            m_entities.append(*m_current);
        } else {
            ++m_dropped;
        }
        m_current.reset();
    }

    QVector<DXFEntity> takeEntities() { return std::move(m_entities); }
    int dropped() const { return m_dropped; }

private:
    QVector<DXFEntity> m_entities;
    std::optional<DXFEntity> m_current;
    int m_dropped = 0;
};

}  // anonymous namespace

CADImportResult importCADString(const QString& text)
{
    CADImportResult result;
    result.success = true;

    if (text.trimmed().isEmpty()) {
        qCWarning(logCadImport) << "importCADString:empty input";
        return result;
    }

    const QStringList lines = text.split(QLatin1Char('\n'));
    const QString entitiesSection = QStringLiteral("ENTITIES");

    EntityCollector collector;
    QString section;

    for (int i = 0; i < lines.size(); i += 2) {
        bool ok = false;
        const int code = lineAt(lines, i).toInt(&ok);
        if (!ok) {
            continue;
        }
        const QString value = lineAt(lines, i + 1);

        if (code == 0) {
            if (value == QLatin1String("SECTION")) {
                // Name is the value of the next pair
                section = lineAt(lines, i + 3);
            } else if (value == QLatin1String("ENDSEC")) {
                section.clear();
            } else if (section == entitiesSection) {
                collector.begin(value);
            }
            continue;
        }

        std::optional<DXFEntity>& entity = collector.current();
        if (!entity || section != entitiesSection) {
            continue;
        }

        switch (code) {
        case 10: {
            // Y and Z ride on the next two pairs
            bool xOk = false;
            const double x = value.toDouble(&xOk);
            if (!xOk || std::isnan(x)) {
                break;
            }
            const double y = ordinateAt(lines, i + 3);
            entity->points.append(Point3(x, 0.0, -y));
            break;
        }
        case 8:
            entity->layer = value;
            break;
        case 40: {
            bool rOk = false;
            const double r = value.toDouble(&rOk);
            if (rOk && r >= 0.0) {
                entity->radius = r;
            }
            break;
        }
        case 62: {
            bool cOk = false;
            const int index = value.toInt(&cOk);
            entity->color = colorFromIndex(cOk ? index : 0);
            break;
        }
        default:
            break;
        }
    }

    collector.finish();

    result.entities = collector.takeEntities();
    result.bounds = entityBounds(result.entities);
    for (const DXFEntity& e : result.entities) {
        if (!result.layers.contains(e.layer)) {
            result.layers.append(e.layer);
        }
    }

    qCInfo(logCadImport) << "importCADString:parsed" << result.entities.size() << "entities"
                         << "layers" << result.layers.size()
                         << "dropped" << collector.dropped();
    return result;
}

CADImportResult importCAD(const QByteArray& data)
{
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(data);

    if (decoder.hasError()) {
        CADImportResult result;
        result.errorMessage = QStringLiteral("Input is not valid UTF-8 text");
        qCWarning(logCadImport) << "importCAD:decode failed" << data.size() << "bytes";
        return result;
    }

    return importCADString(text);
}

CADImportResult importCADFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        CADImportResult result;
        result.errorMessage = QStringLiteral("Cannot open file: %1 (%2)")
                                  .arg(filePath, file.errorString());
        qCWarning(logCadImport) << "importCADFile:open failed" << filePath << file.errorString();
        return result;
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        CADImportResult result;
        result.errorMessage = QStringLiteral("Cannot read file: %1 (%2)")
                                  .arg(filePath, file.errorString());
        qCWarning(logCadImport) << "importCADFile:read failed" << filePath << file.errorString();
        return result;
    }

    CADImportResult result = importCAD(data);
    if (!result.success) {
        result.errorMessage = QStringLiteral("%1: %2").arg(filePath, result.errorMessage);
    }
    return result;
}

// =====================================================================
//  Post-processing
// =====================================================================

BoundingBox3 entityBounds(const QVector<DXFEntity>& entities)
{
    BoundingBox3 bounds;
    for (const DXFEntity& e : entities) {
        for (const Point3& p : e.points) {
            bounds.include(p);
        }
    }
    return bounds;
}

QVector<Point3> tessellateCircle(const DXFEntity& entity, int segments)
{
    QVector<Point3> outline;
    if (entity.type != EntityType::Circle || entity.points.isEmpty()) {
        return outline;
    }

    segments = qMax(segments, 3);
    const Point3& c = entity.points.first();
    outline.reserve(segments + 1);

    for (int i = 0; i <= segments; ++i) {
        const double angle = 2.0 * M_PI * (i % segments) / segments;
        outline.append(Point3(c.x + entity.radius * std::cos(angle),
                              c.y,
                              c.z + entity.radius * std::sin(angle)));
    }
    return outline;
}

QVector<DXFEntity> fitToScene(const QVector<DXFEntity>& entities, double targetSize)
{
    const BoundingBox3 bounds = entityBounds(entities);
    if (bounds.isEmpty()) {
        return entities;
    }

    const Point3 center = bounds.center();
    const Point3 size = bounds.size();
    const double extent = qMax(size.x, size.z);

    double scale = 1.0;
    if (extent > 0.0 && targetSize > 0.0 && (extent > 2.0 * targetSize || extent < 1.0)) {
        scale = targetSize / extent;
    }

    QVector<DXFEntity> fitted = entities;
    for (DXFEntity& e : fitted) {
        for (Point3& p : e.points) {
            p.x = (p.x - center.x) * scale;
            p.z = (p.z - center.z) * scale;
        }
        e.radius *= scale;
    }

    qCDebug(logCadImport) << "fitToScene:extent" << extent << "scale" << scale;
    return fitted;
}

}  // namespace io
}  // namespace massing
