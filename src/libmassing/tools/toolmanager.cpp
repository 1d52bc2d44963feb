// =====================================================================
//  src/libmassing/tools/toolmanager.cpp — Active tool routing
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/tools/toolmanager.h>

#include <QLoggingCategory>

namespace massing {
namespace tools {

Q_LOGGING_CATEGORY(logToolManager, "massing.tools.manager")

ToolManager::ToolManager(const ToolSettings& settings)
    : m_settings(settings)
    , m_rectangle(settings)
    , m_pushPull(settings)
{
}

void ToolManager::setCallbacks(const ToolCallbacks& callbacks)
{
    m_rectangle.setCallbacks(callbacks);
    m_pushPull.setCallbacks(callbacks);
}

void ToolManager::setSettings(const ToolSettings& settings)
{
    m_settings = settings;
    m_rectangle.setSettings(settings);
    m_pushPull.setSettings(settings);
}

void ToolManager::setActiveTool(ActiveTool tool)
{
    if (tool == m_active) {
        return;
    }

    switch (m_active) {
    case ActiveTool::Rectangle:
        m_rectangle.deactivate();
        break;
    case ActiveTool::PushPull:
        m_pushPull.deactivate();
        break;
    case ActiveTool::Select:
    case ActiveTool::None:
        break;
    }

    qCDebug(logToolManager) << "setActiveTool:" << toolId(m_active) << "->" << toolId(tool);
    m_active = tool;
}

void ToolManager::setFootprints(const QVector<model::Rectangle>& footprints)
{
    m_pushPull.setFootprints(footprints);
}

void ToolManager::setSelectedLayerId(const QString& layerId)
{
    m_rectangle.setSelectedLayerId(layerId);
}

void ToolManager::pointerMove(const PointerEvent& event)
{
    switch (m_active) {
    case ActiveTool::Rectangle:
        m_rectangle.pointerMove(event);
        break;
    case ActiveTool::PushPull:
        m_pushPull.pointerMove(event);
        break;
    case ActiveTool::Select:
    case ActiveTool::None:
        break;
    }
}

void ToolManager::pointerClick(const PointerEvent& event)
{
    switch (m_active) {
    case ActiveTool::Rectangle:
        m_rectangle.pointerClick(event);
        break;
    case ActiveTool::PushPull:
        m_pushPull.pointerClick(event);
        break;
    case ActiveTool::Select:
    case ActiveTool::None:
        break;
    }
}

bool ToolManager::cancel()
{
    switch (m_active) {
    case ActiveTool::Rectangle:
        return m_rectangle.cancel();
    case ActiveTool::PushPull:
        return m_pushPull.cancel();
    case ActiveTool::Select:
    case ActiveTool::None:
        break;
    }
    return false;
}

bool ToolManager::isBusy() const
{
    switch (m_active) {
    case ActiveTool::Rectangle:
        return m_rectangle.isDrafting();
    case ActiveTool::PushPull:
        return m_pushPull.isExtruding();
    case ActiveTool::Select:
    case ActiveTool::None:
        break;
    }
    return false;
}

}  // namespace tools
}  // namespace massing
