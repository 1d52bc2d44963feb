#include <gtest/gtest.h>

#include <massing/tools/toolmanager.h>

using namespace massing;
using geometry::Point3;
using geometry::Ray;
using tools::ActiveTool;
using tools::MeasurementUpdate;
using tools::PointerEvent;
using tools::ToolManager;

namespace {

PointerEvent pointer(double x, double z, double screenY = 0.0)
{
    return PointerEvent(QPointF(0.0, screenY), Ray(Point3(x, 10.0, z), Point3(0.0, -1.0, 0.0)));
}

class ToolManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tools::ToolCallbacks callbacks;
        callbacks.onRectangleCreate = [this](const model::Rectangle& r) { rectangles.append(r); };
        callbacks.onExtrusionCreate = [this](const model::Extrusion& e) { extrusions.append(e); };
        callbacks.onMeasurementUpdate = [this](const MeasurementUpdate& u) { updates.append(u); };
        manager.setCallbacks(callbacks);
    }

    ToolManager manager;
    QVector<model::Rectangle> rectangles;
    QVector<model::Extrusion> extrusions;
    QVector<MeasurementUpdate> updates;
};

}  // namespace

TEST(ToolIdTest, RoundTripAndUnknown) {
    EXPECT_EQ(tools::toolFromId(QStringLiteral("rectangle")), ActiveTool::Rectangle);
    EXPECT_EQ(tools::toolFromId(QStringLiteral("push-pull")), ActiveTool::PushPull);
    EXPECT_EQ(tools::toolFromId(QStringLiteral("select")), ActiveTool::Select);
    EXPECT_EQ(tools::toolFromId(QStringLiteral("lasso")), ActiveTool::None);
    EXPECT_EQ(tools::toolId(ActiveTool::PushPull), QStringLiteral("push-pull"));
}

TEST_F(ToolManagerTest, SelectToolIgnoresInput) {
    manager.pointerClick(pointer(0.0, 0.0));
    manager.pointerClick(pointer(2.0, 2.0));
    EXPECT_TRUE(rectangles.isEmpty());
    EXPECT_FALSE(manager.isBusy());
}

TEST_F(ToolManagerTest, RoutesToRectangleTool) {
    manager.setActiveTool(QStringLiteral("rectangle"));
    manager.setSelectedLayerId(QStringLiteral("site"));

    manager.pointerClick(pointer(0.0, 0.0));
    EXPECT_TRUE(manager.isBusy());
    manager.pointerClick(pointer(2.0, 2.0));

    ASSERT_EQ(rectangles.size(), 1);
    EXPECT_EQ(rectangles.first().layerId, QStringLiteral("site"));
    EXPECT_FALSE(manager.pushPullTool().isExtruding());
}

TEST_F(ToolManagerTest, DraftThenExtrude) {
    manager.setActiveTool(ActiveTool::Rectangle);
    manager.pointerClick(pointer(0.0, 0.0));
    manager.pointerClick(pointer(2.0, 2.0));
    ASSERT_EQ(rectangles.size(), 1);

    manager.setFootprints(rectangles);
    manager.setActiveTool(ActiveTool::PushPull);
    manager.pointerMove(pointer(1.0, 1.0, 50.0));
    manager.pointerClick(pointer(1.0, 1.0, 50.0));
    manager.pointerMove(pointer(1.0, 1.0, 10.0));
    manager.pointerClick(pointer(1.0, 1.0, 10.0));

    ASSERT_EQ(extrusions.size(), 1);
    EXPECT_EQ(extrusions.first().baseId, rectangles.first().id);
    EXPECT_DOUBLE_EQ(extrusions.first().depth, 2.0);
}

TEST_F(ToolManagerTest, SwitchingToolCancelsGesture) {
    manager.setActiveTool(ActiveTool::Rectangle);
    manager.pointerClick(pointer(0.0, 0.0));
    manager.pointerMove(pointer(1.0, 1.0));
    ASSERT_TRUE(manager.isBusy());
    const int before = updates.size();

    manager.setActiveTool(QStringLiteral("select"));
    EXPECT_FALSE(manager.rectangleTool().isDrafting());
    ASSERT_EQ(updates.size(), before + 1);
    EXPECT_FALSE(updates.last().isDrawing);
    EXPECT_EQ(updates.last().activeTool, ActiveTool::Rectangle);
    EXPECT_TRUE(rectangles.isEmpty());
}

TEST_F(ToolManagerTest, CancelOnlyAffectsLiveTool) {
    EXPECT_FALSE(manager.cancel());

    manager.setActiveTool(ActiveTool::Rectangle);
    manager.pointerClick(pointer(0.0, 0.0));
    EXPECT_TRUE(manager.cancel());
    EXPECT_FALSE(manager.isBusy());
    EXPECT_FALSE(manager.cancel());
}

TEST_F(ToolManagerTest, SwitchingAwayForgetsPushPullHover) {
    const model::Rectangle base = model::createRectangle(Point3(0.0, 0.0, 0.0), Point3(2.0, 0.0, 2.0),
                                                         QString());
    manager.setFootprints({base});
    manager.setActiveTool(ActiveTool::PushPull);
    manager.pointerMove(pointer(1.0, 1.0, 50.0));
    ASSERT_TRUE(manager.pushPullTool().hovered().has_value());

    manager.setActiveTool(ActiveTool::Select);
    EXPECT_FALSE(manager.pushPullTool().hovered().has_value());

    // Coming back, a click before any move starts nothing
    manager.setActiveTool(ActiveTool::PushPull);
    manager.pointerClick(pointer(1.0, 1.0, 50.0));
    EXPECT_FALSE(manager.isBusy());
    EXPECT_TRUE(extrusions.isEmpty());
}

TEST_F(ToolManagerTest, SwitchingAwayForgetsRectangleHoverPoint) {
    manager.setActiveTool(ActiveTool::Rectangle);
    manager.pointerMove(pointer(1.0, 1.0));
    const auto* idle = std::get_if<tools::RectangleTool::Idle>(&manager.rectangleTool().state());
    ASSERT_NE(idle, nullptr);
    ASSERT_TRUE(idle->hoverPoint.has_value());
    const int before = updates.size();

    manager.setActiveTool(ActiveTool::PushPull);
    idle = std::get_if<tools::RectangleTool::Idle>(&manager.rectangleTool().state());
    ASSERT_NE(idle, nullptr);
    EXPECT_FALSE(idle->hoverPoint.has_value());
    EXPECT_EQ(updates.size(), before);
}

TEST_F(ToolManagerTest, BusyWhileExtruding) {
    const model::Rectangle base = model::createRectangle(Point3(0.0, 0.0, 0.0), Point3(2.0, 0.0, 2.0),
                                                         QString());
    manager.setFootprints({base});
    manager.setActiveTool(ActiveTool::PushPull);
    EXPECT_FALSE(manager.isBusy());

    manager.pointerMove(pointer(1.0, 1.0, 50.0));
    EXPECT_FALSE(manager.isBusy());
    manager.pointerClick(pointer(1.0, 1.0, 50.0));
    EXPECT_TRUE(manager.isBusy());

    manager.pointerMove(pointer(1.0, 1.0, 10.0));
    manager.pointerClick(pointer(1.0, 1.0, 10.0));
    EXPECT_FALSE(manager.isBusy());
    EXPECT_EQ(extrusions.size(), 1);
}

TEST_F(ToolManagerTest, LayersAreKept) {
    QVector<model::Layer> layers;
    layers.append(model::Layer{QStringLiteral("site"), QStringLiteral("Site"), false, QColor()});
    manager.setLayers(layers);
    ASSERT_EQ(manager.layers().size(), 1);
    EXPECT_FALSE(manager.layers().first().visible);
}
