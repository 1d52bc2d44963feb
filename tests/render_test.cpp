#include <gtest/gtest.h>

#include <massing/render/entityrenderer.h>
#include <massing/render/importrenderer.h>
#include <massing/render/toolpreview.h>
#include <massing/tools/toolmanager.h>

using namespace massing;
using geometry::Point3;
using render::Primitive;
using render::PrimitiveKind;
using render::findPrimitive;

namespace {

int countRole(const QVector<Primitive>& primitives, const QString& role)
{
    int n = 0;
    for (const Primitive& p : primitives) {
        if (p.role == role) {
            ++n;
        }
    }
    return n;
}

model::Rectangle makeBase()
{
    return model::createRectangle(Point3(0.0, 0.0, 0.0), Point3(4.0, 0.0, 2.0),
                                  QStringLiteral("L1"));
}

}  // namespace

TEST(ExtrusionRenderTest, UnselectedExtrusion) {
    const model::Extrusion e = model::createExtrusion(makeBase(), 3.0);
    const QVector<Primitive> prims = render::buildExtrusionPrimitives(e, QString(), {});

    ASSERT_EQ(prims.size(), 2);
    const Primitive* solid = findPrimitive(prims, QStringLiteral("extrusion.solid"));
    ASSERT_NE(solid, nullptr);
    EXPECT_EQ(solid->kind, PrimitiveKind::Box);
    EXPECT_EQ(solid->size, Point3(4.0, 3.0, 2.0));
    EXPECT_DOUBLE_EQ(solid->center.y, e.position.y + 1.5);
    EXPECT_EQ(solid->color, e.color);
    EXPECT_DOUBLE_EQ(solid->opacity, 0.8);

    const Primitive* edges = findPrimitive(prims, QStringLiteral("extrusion.edges"));
    ASSERT_NE(edges, nullptr);
    EXPECT_EQ(edges->kind, PrimitiveKind::BoxEdges);
    EXPECT_EQ(edges->center, solid->center);
    EXPECT_EQ(edges->color.name(), QStringLiteral("#1e40af"));
}

TEST(ExtrusionRenderTest, IntrusionSitsBelowAndIsRed) {
    const model::Extrusion e = model::createExtrusion(makeBase(), -2.0);
    const QVector<Primitive> prims = render::buildExtrusionPrimitives(e, QString(), {});

    const Primitive* solid = findPrimitive(prims, QStringLiteral("extrusion.solid"));
    ASSERT_NE(solid, nullptr);
    EXPECT_DOUBLE_EQ(solid->center.y, e.position.y - 1.0);
    EXPECT_EQ(solid->color.name(), QStringLiteral("#ef4444"));
}

TEST(ExtrusionRenderTest, SelectionOverridesColorAndAddsIndicators) {
    const ToolSettings settings;
    for (double height : {2.0, -2.0}) {
        const model::Extrusion e = model::createExtrusion(makeBase(), height);
        const QVector<Primitive> prims = render::buildExtrusionPrimitives(e, e.id, {}, settings);

        const Primitive* solid = findPrimitive(prims, QStringLiteral("extrusion.solid"));
        ASSERT_NE(solid, nullptr);
        EXPECT_EQ(solid->color, settings.highlightColor) << "height " << height;
        EXPECT_EQ(findPrimitive(prims, QStringLiteral("extrusion.edges"))->color, settings.highlightColor);

        EXPECT_EQ(countRole(prims, QStringLiteral("extrusion.base-outline")), 1);
        EXPECT_EQ(countRole(prims, QStringLiteral("extrusion.top-outline")), 1);
        EXPECT_EQ(countRole(prims, QStringLiteral("extrusion.corner")), 4);

        const Primitive* top = findPrimitive(prims, QStringLiteral("extrusion.top-outline"));
        EXPECT_DOUBLE_EQ(top->center.y, e.position.y + height);
        EXPECT_EQ(top->vertices.size(), 8);
    }
}

TEST(ExtrusionRenderTest, HiddenLayerIsTranslucent) {
    const model::Extrusion e = model::createExtrusion(makeBase(), 1.0);
    QVector<model::Layer> layers;
    layers.append(model::Layer{QStringLiteral("L1"), QStringLiteral("Site"), false, QColor()});

    const QVector<Primitive> prims = render::buildExtrusionPrimitives(e, QString(), layers);
    ASSERT_EQ(prims.size(), 2);
    EXPECT_DOUBLE_EQ(prims.first().opacity, 0.3);
}

TEST(ExtrusionRenderTest, Bounds) {
    const model::Extrusion down = model::createExtrusion(makeBase(), -2.0);
    const geometry::BoundingBox3 box = render::extrusionBounds(down);
    EXPECT_DOUBLE_EQ(box.max.y, down.position.y);
    EXPECT_DOUBLE_EQ(box.min.y, down.position.y - 2.0);
    EXPECT_DOUBLE_EQ(box.size().x, 4.0);
}

TEST(RectangleRenderTest, PlaneAndEdges) {
    const model::Rectangle r = makeBase();
    const QVector<Primitive> prims = render::buildRectanglePrimitives(r, QString(), {});

    ASSERT_EQ(prims.size(), 2);
    const Primitive* plane = findPrimitive(prims, QStringLiteral("rectangle.plane"));
    ASSERT_NE(plane, nullptr);
    EXPECT_EQ(plane->center, r.position);
    EXPECT_EQ(plane->rotation, r.rotation);
    EXPECT_EQ(plane->size, Point3(4.0, 2.0, 0.0));
    EXPECT_EQ(plane->color.name(), QStringLiteral("#3b82f6"));
}

TEST(RectangleRenderTest, LayerColorAndHiddenLayer) {
    const model::Rectangle r = makeBase();
    QVector<model::Layer> layers;
    layers.append(model::Layer{QStringLiteral("L1"), QStringLiteral("Site"), true, QColor(0x22, 0xc5, 0x5e)});

    const QVector<Primitive> shown = render::buildRectanglePrimitives(r, QString(), layers);
    EXPECT_EQ(findPrimitive(shown, QStringLiteral("rectangle.plane"))->color.name(),
              QStringLiteral("#22c55e"));

    layers.first().visible = false;
    EXPECT_TRUE(render::buildRectanglePrimitives(r, QString(), layers).isEmpty());
}

TEST(RectangleRenderTest, SelectedHasHaloAndMarkers) {
    const model::Rectangle r = makeBase();
    const QVector<Primitive> prims = render::buildRectanglePrimitives(r, r.id, {});

    EXPECT_EQ(findPrimitive(prims, QStringLiteral("rectangle.plane"))->color, ToolSettings().highlightColor);
    const Primitive* halo = findPrimitive(prims, QStringLiteral("rectangle.halo"));
    ASSERT_NE(halo, nullptr);
    EXPECT_TRUE(halo->wireframe);
    EXPECT_NEAR(halo->size.x, 4.02, 1e-12);

    const Primitive* start = findPrimitive(prims, QStringLiteral("rectangle.start-marker"));
    const Primitive* end = findPrimitive(prims, QStringLiteral("rectangle.end-marker"));
    const Primitive* center = findPrimitive(prims, QStringLiteral("rectangle.center-marker"));
    ASSERT_NE(start, nullptr);
    ASSERT_NE(end, nullptr);
    ASSERT_NE(center, nullptr);
    EXPECT_DOUBLE_EQ(start->center.x, 0.0);
    EXPECT_DOUBLE_EQ(end->center.x, 4.0);
    EXPECT_DOUBLE_EQ(center->center.z, 1.0);
}

TEST(ScenePrimitivesTest, FootprintsThenExtrusions) {
    const model::Rectangle r = makeBase();
    const model::Extrusion e = model::createExtrusion(r, 1.0);
    const QVector<Primitive> prims = render::buildScenePrimitives({r}, {e}, QString(), {});
    ASSERT_EQ(prims.size(), 4);
    EXPECT_EQ(prims.first().role, QStringLiteral("rectangle.plane"));
    EXPECT_EQ(prims.last().role, QStringLiteral("extrusion.edges"));
}

// ---- Tool previews ----

namespace {

tools::PointerEvent pointer(double x, double z, double screenY = 0.0)
{
    return tools::PointerEvent(QPointF(0.0, screenY),
                               geometry::Ray(Point3(x, 10.0, z), Point3(0.0, -1.0, 0.0)));
}

}  // namespace

TEST(RectanglePreviewTest, FollowsDraftState) {
    tools::RectangleTool tool;
    EXPECT_TRUE(render::buildRectanglePreview(tool.state()).isEmpty());

    tool.pointerMove(pointer(1.0, 1.0));
    QVector<Primitive> prims = render::buildRectanglePreview(tool.state());
    ASSERT_EQ(prims.size(), 1);
    EXPECT_EQ(prims.first().kind, PrimitiveKind::Ring);

    tool.pointerClick(pointer(1.0, 1.0));
    prims = render::buildRectanglePreview(tool.state());
    ASSERT_EQ(prims.size(), 1);
    EXPECT_EQ(prims.first().role, QStringLiteral("preview.start-marker"));

    tool.pointerMove(pointer(3.0, 2.0));
    prims = render::buildRectanglePreview(tool.state());
    EXPECT_EQ(prims.size(), 3);
    const Primitive* plane = findPrimitive(prims, QStringLiteral("preview.plane"));
    ASSERT_NE(plane, nullptr);
    EXPECT_EQ(plane->size, Point3(2.0, 1.0, 0.0));
    EXPECT_DOUBLE_EQ(plane->center.x, 2.0);
    EXPECT_DOUBLE_EQ(plane->center.z, 1.5);
}

TEST(PushPullPreviewTest, HoverAndExtrude) {
    const model::Rectangle base = makeBase();
    tools::PushPullTool tool;
    tool.setFootprints({base});

    tool.pointerMove(pointer(1.0, 1.0, 100.0));
    QVector<Primitive> prims = render::buildPushPullPreview(tool.state());
    const Primitive* hover = findPrimitive(prims, QStringLiteral("preview.hover"));
    ASSERT_NE(hover, nullptr);
    EXPECT_EQ(hover->color.name(), QStringLiteral("#10b981"));

    // Zero height draws nothing
    tool.pointerClick(pointer(1.0, 1.0, 100.0));
    EXPECT_TRUE(render::buildPushPullPreview(tool.state()).isEmpty());

    // Downward drag: centered at base.y + height / 2, red
    tool.pointerMove(pointer(1.0, 1.0, 140.0));
    prims = render::buildPushPullPreview(tool.state());
    const Primitive* volume = findPrimitive(prims, QStringLiteral("preview.volume"));
    ASSERT_NE(volume, nullptr);
    EXPECT_DOUBLE_EQ(volume->center.y, base.position.y - 1.0);
    EXPECT_DOUBLE_EQ(volume->size.y, 2.0);
    EXPECT_EQ(volume->color.name(), QStringLiteral("#ef4444"));
    EXPECT_NE(findPrimitive(prims, QStringLiteral("preview.base-outline")), nullptr);

    // Upward drag is blue
    tool.pointerMove(pointer(1.0, 1.0, 60.0));
    prims = render::buildPushPullPreview(tool.state());
    volume = findPrimitive(prims, QStringLiteral("preview.volume"));
    ASSERT_NE(volume, nullptr);
    EXPECT_DOUBLE_EQ(volume->center.y, base.position.y + 1.0);
    EXPECT_EQ(volume->color.name(), QStringLiteral("#3b82f6"));
}

TEST(ToolPreviewTest, FollowsActiveTool) {
    tools::ToolManager manager;
    manager.pointerMove(pointer(1.0, 1.0));
    EXPECT_TRUE(render::buildToolPreview(manager).isEmpty());

    manager.setActiveTool(tools::ActiveTool::Rectangle);
    manager.pointerMove(pointer(1.0, 1.0));
    EXPECT_EQ(render::buildToolPreview(manager).size(), 1);
}

TEST(PushPullPreviewTest, HiddenLayerDimsFeedback) {
    const model::Rectangle base = makeBase();
    tools::ToolManager manager;
    manager.setFootprints({base});
    manager.setActiveTool(tools::ActiveTool::PushPull);
    manager.pointerMove(pointer(1.0, 1.0, 100.0));

    const Primitive* hover = findPrimitive(render::buildToolPreview(manager), QStringLiteral("preview.hover"));
    ASSERT_NE(hover, nullptr);
    EXPECT_DOUBLE_EQ(hover->opacity, 0.3);

    QVector<model::Layer> layers;
    layers.append(model::Layer{QStringLiteral("L1"), QStringLiteral("Site"), false, QColor()});
    manager.setLayers(layers);

    const QVector<Primitive> dimmed = render::buildToolPreview(manager);
    hover = findPrimitive(dimmed, QStringLiteral("preview.hover"));
    ASSERT_NE(hover, nullptr);
    EXPECT_NEAR(hover->opacity, 0.3 * 0.3, 1e-12);
    EXPECT_NEAR(findPrimitive(dimmed, QStringLiteral("preview.hover-outline"))->opacity, 0.8 * 0.3, 1e-12);
}

// ---- Imported drawings ----

namespace {

io::DXFEntity importedEntity(io::EntityType type, const QString& name, const QVector<Point3>& points)
{
    io::DXFEntity e;
    e.type = type;
    e.typeName = name;
    e.points = points;
    return e;
}

}  // namespace

TEST(ImportRenderTest, LinesAndPolylinesBecomeSegments) {
    io::DXFEntity line = importedEntity(io::EntityType::Line, QStringLiteral("LINE"),
                                        {Point3(0.0, 0.0, 0.0), Point3(5.0, 0.0, 0.0)});
    line.color = QColor(0xFF, 0x00, 0x00);
    const io::DXFEntity poly = importedEntity(io::EntityType::Polyline, QStringLiteral("POLYLINE"),
                                              {Point3(0.0, 0.0, 0.0), Point3(1.0, 0.0, 0.0),
                                               Point3(1.0, 0.0, 1.0)});

    const QVector<Primitive> prims = render::buildImportPrimitives({line, poly});
    ASSERT_EQ(prims.size(), 2);

    const Primitive& l = prims[0];
    EXPECT_EQ(l.kind, PrimitiveKind::LineSegments);
    EXPECT_EQ(l.role, QStringLiteral("import.line"));
    EXPECT_DOUBLE_EQ(l.center.y, 0.01);
    EXPECT_DOUBLE_EQ(l.lineWidth, 2.0);
    EXPECT_EQ(l.color.name(), QStringLiteral("#ff0000"));
    ASSERT_EQ(l.vertices.size(), 2);
    EXPECT_EQ(l.vertices[1], Point3(5.0, 0.0, 0.0));

    const Primitive& p = prims[1];
    EXPECT_EQ(p.role, QStringLiteral("import.polyline"));
    EXPECT_DOUBLE_EQ(p.lineWidth, 1.5);
    EXPECT_EQ(p.color.name(), QStringLiteral("#000000"));
    ASSERT_EQ(p.vertices.size(), 4);
    EXPECT_EQ(p.vertices[1], p.vertices[2]);
}

TEST(ImportRenderTest, CircleOutline) {
    io::DXFEntity circle = importedEntity(io::EntityType::Circle, QStringLiteral("CIRCLE"),
                                          {Point3(2.0, 0.0, -1.0)});
    circle.radius = 1.0;

    const QVector<Primitive> prims = render::buildImportEntityPrimitives(circle);
    ASSERT_EQ(prims.size(), 1);
    EXPECT_EQ(prims.first().role, QStringLiteral("import.circle"));
    EXPECT_EQ(prims.first().vertices.size(), 32 * 2);
    for (const Point3& v : prims.first().vertices) {
        EXPECT_NEAR(v.distanceTo(Point3(2.0, 0.0, -1.0)), 1.0, 1e-9);
    }
}

TEST(ImportRenderTest, SkipsUndrawableRecords) {
    const io::DXFEntity single = importedEntity(io::EntityType::Line, QStringLiteral("LINE"),
                                                {Point3()});
    const io::DXFEntity arc = importedEntity(io::EntityType::Other, QStringLiteral("ARC"),
                                             {Point3(), Point3(1.0, 0.0, 0.0)});
    EXPECT_TRUE(render::buildImportPrimitives({single, arc}).isEmpty());
    EXPECT_TRUE(render::buildImportPrimitives({}).isEmpty());
}
