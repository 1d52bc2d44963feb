// =====================================================================
//  src/libmassing/tools/rectangletool.cpp — Two-click footprint tool
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/tools/rectangletool.h>
#include <massing/geometry/intersections.h>

#include <QLoggingCategory>
#include <QtMath>

namespace massing {
namespace tools {

Q_LOGGING_CATEGORY(logRectangleTool, "massing.tools.rectangle")

using geometry::Point3;

RectangleMeasurements measureRectangle(const Point3& start, const Point3& end)
{
    RectangleMeasurements m;
    m.width = qAbs(end.x - start.x);
    m.height = qAbs(end.z - start.z);
    m.area = m.width * m.height;
    m.perimeter = 2.0 * (m.width + m.height);
    return m;
}

RectangleTool::RectangleTool(const ToolSettings& settings)
    : m_settings(settings)
    , m_state(Idle{})
{
}

std::optional<Point3> RectangleTool::groundPoint(const PointerEvent& event) const
{
    if (!event.ray) {
        return std::nullopt;
    }
    return geometry::intersectGround(*event.ray, m_settings.groundHeight,
                                     m_settings.parallelTolerance);
}

// =====================================================================
//  Pointer Handling
// =====================================================================

void RectangleTool::pointerMove(const PointerEvent& event)
{
    const std::optional<Point3> hit = groundPoint(event);

    if (auto* idle = std::get_if<Idle>(&m_state)) {
        idle->hoverPoint = hit;
        return;
    }

    if (!hit) {
        return;  // No target this frame; keep the last good point
    }

    auto& draft = std::get<Drafting>(m_state);
    draft.current = *hit;

    const bool wasVisible = draft.previewVisible;
    draft.previewVisible = draft.start.distanceTo(draft.current) >= m_settings.minimumRectangleDistance;
    if (draft.previewVisible != wasVisible) {
        qCDebug(logRectangleTool) << "pointerMove:preview" << draft.previewVisible;
    }

    if (draft.previewVisible) {
        emitMeasurements(draft);
    }
}

void RectangleTool::pointerClick(const PointerEvent& event)
{
    const std::optional<Point3> hit = groundPoint(event);

    if (!isDrafting()) {
        if (!hit) {
            return;
        }
        Drafting draft;
        draft.start = *hit;
        draft.current = *hit;
        qCDebug(logRectangleTool) << "pointerClick:start" << hit->x << hit->z;
        m_state = draft;
        return;
    }

    auto& draft = std::get<Drafting>(m_state);
    if (hit) {
        draft.current = *hit;
    }
    finishDraft(draft.current);
}

bool RectangleTool::cancel()
{
    if (!isDrafting()) {
        return false;
    }

    qCDebug(logRectangleTool) << "cancel:draft discarded";
    resetToIdle();
    emitCleared();
    return true;
}

void RectangleTool::deactivate()
{
    if (!cancel()) {
        resetToIdle();
    }
}

std::optional<RectangleMeasurements> RectangleTool::liveMeasurements() const
{
    if (const auto* draft = std::get_if<Drafting>(&m_state)) {
        return measureRectangle(draft->start, draft->current);
    }
    return std::nullopt;
}

// =====================================================================
//  Commit
// =====================================================================

void RectangleTool::finishDraft(Point3 end)
{
    const Point3 start = std::get<Drafting>(m_state).start;
    const RectangleMeasurements m = measureRectangle(start, end);

    resetToIdle();

    if (m.width > m_settings.minimumRectangleSize && m.height > m_settings.minimumRectangleSize) {
        const model::Rectangle rect = model::createRectangle(start, end, m_layerId, m_settings);
        qCInfo(logRectangleTool) << "finishDraft:created" << rect.id
                                 << "width" << rect.width << "height" << rect.height
                                 << "layer" << rect.layerId;
        if (m_callbacks.onRectangleCreate) {
            m_callbacks.onRectangleCreate(rect);
        }
    } else {
        qCDebug(logRectangleTool) << "finishDraft:below minimum size"
                                  << m.width << m.height;
    }

    emitCleared();
}

void RectangleTool::resetToIdle()
{
    m_state = Idle{};
}

void RectangleTool::emitMeasurements(const Drafting& draft) const
{
    if (!m_callbacks.onMeasurementUpdate) {
        return;
    }

    MeasurementUpdate update;
    update.isDrawing = true;
    update.activeTool = ActiveTool::Rectangle;
    update.measurements = measureRectangle(draft.start, draft.current);
    m_callbacks.onMeasurementUpdate(update);
}

void RectangleTool::emitCleared() const
{
    if (!m_callbacks.onMeasurementUpdate) {
        return;
    }

    MeasurementUpdate update;
    update.isDrawing = false;
    update.activeTool = ActiveTool::Rectangle;
    m_callbacks.onMeasurementUpdate(update);
}

}  // namespace tools
}  // namespace massing
