// =====================================================================
//  src/libmassing/tools/pushpulltool.cpp — Footprint extrusion tool
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/tools/pushpulltool.h>
#include <massing/geometry/intersections.h>

#include <QLoggingCategory>
#include <QtMath>

namespace massing {
namespace tools {

Q_LOGGING_CATEGORY(logPushPullTool, "massing.tools.pushpull")

ExtrusionMeasurements measureExtrusion(const model::Rectangle& base, double signedHeight)
{
    ExtrusionMeasurements m;
    m.height = signedHeight;
    m.baseArea = base.width * base.height;
    m.volume = m.baseArea * signedHeight;
    return m;
}

PushPullTool::PushPullTool(const ToolSettings& settings)
    : m_settings(settings)
    , m_state(Idle{})
{
}

// =====================================================================
//  Candidates
// =====================================================================

const model::Rectangle* PushPullTool::findFootprint(const QString& id) const
{
    for (const model::Rectangle& rect : m_footprints) {
        if (rect.id == id) {
            return &rect;
        }
    }
    return nullptr;
}

void PushPullTool::setFootprints(const QVector<model::Rectangle>& footprints)
{
    m_footprints = footprints;

    if (auto* hovering = std::get_if<Hovering>(&m_state)) {
        if (const model::Rectangle* rect = findFootprint(hovering->target.id)) {
            hovering->target = *rect;
        } else {
            qCDebug(logPushPullTool) << "setFootprints:hover target removed" << hovering->target.id;
            m_state = Idle{};
        }
    } else if (auto* drag = std::get_if<Extruding>(&m_state)) {
        if (const model::Rectangle* rect = findFootprint(drag->target.id)) {
            drag->target = *rect;
        } else {
            qCDebug(logPushPullTool) << "setFootprints:drag target removed" << drag->target.id;
            cancel();
        }
    }
}

// =====================================================================
//  Hover
// =====================================================================

std::optional<model::Rectangle> PushPullTool::pick(const geometry::Ray& ray) const
{
    std::optional<model::Rectangle> nearest;
    double nearestDistance = 0.0;

    for (const model::Rectangle& rect : m_footprints) {
        const std::optional<double> t = geometry::rayRectangleDistance(
            ray, rect.position, rect.width, rect.height, m_settings.parallelTolerance);
        if (t && (!nearest || *t < nearestDistance)) {
            nearest = rect;
            nearestDistance = *t;
        }
    }

    return nearest;
}

void PushPullTool::updateHover(const PointerEvent& event)
{
    const std::optional<model::Rectangle> hit = event.ray ? pick(*event.ray) : std::nullopt;

    if (hit) {
        const auto* hovering = std::get_if<Hovering>(&m_state);
        if (!hovering || hovering->target.id != hit->id) {
            qCDebug(logPushPullTool) << "updateHover:target" << hit->id;
        }
        m_state = Hovering{*hit};
    } else {
        m_state = Idle{};
    }
}

std::optional<model::Rectangle> PushPullTool::hovered() const
{
    if (const auto* hovering = std::get_if<Hovering>(&m_state)) {
        return hovering->target;
    }
    return std::nullopt;
}

// =====================================================================
//  Pointer Handling
// =====================================================================

void PushPullTool::pointerMove(const PointerEvent& event)
{
    if (auto* drag = std::get_if<Extruding>(&m_state)) {
        drag->height = (event.screenPos.y() - drag->dragStartY) * -1.0 * m_settings.pushPullSensitivity;
        emitMeasurements(*drag);
        return;
    }

    updateHover(event);
}

void PushPullTool::pointerClick(const PointerEvent& event)
{
    if (isExtruding()) {
        finishExtrusion();
        return;
    }

    if (const auto* hovering = std::get_if<Hovering>(&m_state)) {
        Extruding drag;
        drag.target = hovering->target;
        drag.dragStartY = event.screenPos.y();
        drag.height = 0.0;
        qCDebug(logPushPullTool) << "pointerClick:start" << drag.target.id
                                 << "y" << drag.dragStartY;
        m_state = drag;
    }
}

bool PushPullTool::cancel()
{
    if (!isExtruding()) {
        return false;
    }

    qCDebug(logPushPullTool) << "cancel:extrusion discarded";
    m_state = Idle{};
    emitCleared();
    return true;
}

void PushPullTool::deactivate()
{
    if (!cancel()) {
        m_state = Idle{};
    }
}

std::optional<ExtrusionMeasurements> PushPullTool::liveMeasurements() const
{
    if (const auto* drag = std::get_if<Extruding>(&m_state)) {
        return measureExtrusion(drag->target, drag->height);
    }
    return std::nullopt;
}

// =====================================================================
//  Commit
// =====================================================================

void PushPullTool::finishExtrusion()
{
    const Extruding drag = std::get<Extruding>(m_state);
    m_state = Idle{};

    if (qAbs(drag.height) > m_settings.minimumExtrusionHeight) {
        const model::Extrusion ext = model::createExtrusion(drag.target, drag.height, m_settings);
        qCInfo(logPushPullTool) << "finishExtrusion:created" << ext.id
                                << "base" << ext.baseId << "depth" << ext.depth
                                << "intrusion" << ext.isIntrusion;
        if (m_callbacks.onExtrusionCreate) {
            m_callbacks.onExtrusionCreate(ext);
        }
    } else {
        qCDebug(logPushPullTool) << "finishExtrusion:below minimum height" << drag.height;
    }

    emitCleared();
}

void PushPullTool::emitMeasurements(const Extruding& drag) const
{
    if (!m_callbacks.onMeasurementUpdate) {
        return;
    }

    MeasurementUpdate update;
    update.isDrawing = true;
    update.activeTool = ActiveTool::PushPull;
    update.measurements = measureExtrusion(drag.target, drag.height);
    m_callbacks.onMeasurementUpdate(update);
}

void PushPullTool::emitCleared() const
{
    if (!m_callbacks.onMeasurementUpdate) {
        return;
    }

    MeasurementUpdate update;
    update.isDrawing = false;
    update.activeTool = ActiveTool::PushPull;
    m_callbacks.onMeasurementUpdate(update);
}

}  // namespace tools
}  // namespace massing
