#include <QtTest/QTest>
#include <QSignalSpy>
#include "scene.h"
#include "workspace.h"

using namespace cadb;

static SceneObject makeBox(const QString& name, double l, double w, double h) {
    SceneObject o;
    o.name = name;
    o.kind = PrimitiveKind::Box;
    o.dims.length = l;
    o.dims.width = w;
    o.dims.height = h;
    return o;
}

class TestScene : public QObject {
    Q_OBJECT
private slots:
    void testPrimitiveStringRoundTrip() {
        for (const auto& m : kPrimitiveMeta) {
            bool ok = false;
            QCOMPARE(primitiveFromString(QString::fromLatin1(m.name), &ok), m.kind);
            QVERIFY(ok);
        }
        bool ok = false;
        QCOMPARE(primitiveFromString("cylinder", &ok), PrimitiveKind::Cylinder);
        QVERIFY(ok);
        primitiveFromString("Wedge", &ok);
        QVERIFY(!ok);
    }

    void testBoxDescriptors() {
        SceneObject box = makeBox("Box", 10, 20, 30);
        QCOMPARE(box.volume(), 6000.0);
        QCOMPARE(box.edgeCount(), 12);
        QCOMPARE(box.faces().size(), 6);
        QCOMPARE(box.area(), 2.0 * (10 * 20 + 10 * 30 + 20 * 30));

        BoundingBox bb = box.boundingBox();
        QCOMPARE(bb.min, QVector3D(0, 0, 0));
        QCOMPARE(bb.max, QVector3D(10, 20, 30));
    }

    void testBoundingBoxFollowsPlacement() {
        SceneObject box = makeBox("Box", 10, 10, 10);
        box.position = QVector3D(5, 0, 0);
        BoundingBox bb = box.boundingBox();
        QCOMPARE(bb.min, QVector3D(5, 0, 0));
        QCOMPARE(bb.max, QVector3D(15, 10, 10));

        // A quarter turn about z swaps the x and y extents
        SceneObject slab = makeBox("Slab", 20, 4, 2);
        slab.rotation = QVector3D(0, 0, 90);
        QVector3D size = slab.boundingBox().size();
        QVERIFY(qAbs(size.x() - 4.0f) < 1e-3f);
        QVERIFY(qAbs(size.y() - 20.0f) < 1e-3f);
    }

    void testFaceLookup() {
        SceneObject box = makeBox("Box", 10, 10, 10);
        FaceInfo top;
        QVERIFY(box.face("Face6", &top));
        QCOMPARE(top.surface, QString("Plane"));
        QVERIFY(top.hasNormal);
        QCOMPARE(top.normal, QVector3D(0, 0, 1));
        QCOMPARE(top.centroid, QVector3D(5, 5, 10));

        QVERIFY(box.face("Face1", nullptr));
        QVERIFY(!box.face("Face7", nullptr));
    }

    void testCurvedFaces() {
        SceneObject cyl;
        cyl.kind = PrimitiveKind::Cylinder;
        cyl.dims.radius = 2;
        cyl.dims.height = 10;
        auto faces = cyl.faces();
        QCOMPARE(faces.size(), 3);
        QCOMPARE(faces[0].surface, QString("Cylinder"));
        QVERIFY(!faces[0].hasNormal);

        SceneObject sphere;
        sphere.kind = PrimitiveKind::Sphere;
        QCOMPARE(sphere.faces().size(), 1);

        // A pointed cone has no top cap
        SceneObject cone;
        cone.kind = PrimitiveKind::Cone;
        cone.dims.radius2 = 0;
        QCOMPARE(cone.faces().size(), 2);
        QCOMPARE(cone.edgeCount(), 2);
    }

    void testDescribe() {
        SceneObject box = makeBox("Box", 10, 10, 10);
        QJsonObject d = box.describe();
        QCOMPARE(d.value("type").toString(), QString("Part::Box"));
        QCOMPARE(d.value("faces").toInt(), 6);
        QCOMPARE(d.value("edges").toInt(), 12);
        QJsonObject dims = d.value("dimensions").toObject();
        QCOMPARE(dims.value("volume").toDouble(), 1000.0);
        QCOMPARE(dims.value("length").toDouble(), 10.0);
    }

    void testDocumentUniqueNames() {
        Document doc;
        QCOMPARE(doc.add(makeBox("Box", 1, 1, 1)).name, QString("Box"));
        QCOMPARE(doc.add(makeBox("Box", 1, 1, 1)).name, QString("Box001"));
        QCOMPARE(doc.add(makeBox("Box", 1, 1, 1)).name, QString("Box002"));
        QCOMPARE(doc.objects.size(), 3);
        QVERIFY(doc.modified);
        QCOMPARE(doc.find("Box001")->label, QString("Box001"));
    }

    void testRemoveDropsSelection() {
        Document doc;
        doc.add(makeBox("A", 1, 1, 1));
        doc.add(makeBox("B", 1, 1, 1));
        doc.selection = {"A", "A.Face1", "B.Face2"};
        QVERIFY(doc.remove("A"));
        QCOMPARE(doc.selection, QStringList{"B.Face2"});
        QVERIFY(!doc.remove("A"));
        QVERIFY(!doc.find("A"));
    }

    void testDocumentJson() {
        Document doc;
        doc.name = "Part";
        SceneObject& b = doc.add(makeBox("Box", 2, 3, 4));
        b.position = QVector3D(1, 2, 3);
        SceneObject t;
        t.name = "Ring";
        t.kind = PrimitiveKind::Torus;
        t.dims.radius = 8;
        t.dims.radius2 = 1;
        doc.add(t);

        QJsonObject json = doc.toJson();
        QCOMPARE(json.value("format").toString(), QString("cadbridge-document"));

        Document r = Document::fromJson(json);
        QCOMPARE(r.name, QString("Part"));
        QCOMPARE(r.objects.size(), 2);
        QCOMPARE(r.objects[0].position, QVector3D(1, 2, 3));
        QCOMPARE(r.objects[0].dims.height, 4.0);
        QCOMPARE(r.objects[1].kind, PrimitiveKind::Torus);
        QCOMPARE(r.objects[1].dims.radius2, 1.0);
        QVERIFY(!r.modified);
    }

    void testVecFromJsonRejectsBadShapes() {
        QVector3D v;
        QVERIFY(vecFromJson(QJsonArray{1, 2, 3}, &v));
        QCOMPARE(v, QVector3D(1, 2, 3));
        QVERIFY(!vecFromJson(QJsonArray{1, 2}, &v));
        QVERIFY(!vecFromJson(QJsonArray{1, "2", 3}, &v));
        QVERIFY(!vecFromJson(QJsonValue(5), &v));
    }

    void testWorkspaceDocuments() {
        Workspace ws;
        QSignalSpy spy(&ws, &Workspace::changed);
        QVERIFY(!ws.activeDocument());

        Document* a = ws.createDocument("Part");
        Document* b = ws.createDocument("Part");
        QCOMPARE(a->name, QString("Part"));
        QCOMPARE(b->name, QString("Part1"));
        QCOMPARE(ws.activeDocument(), b);
        QCOMPARE(ws.documentCount(), 2);

        QVERIFY(ws.setActiveDocument("Part"));
        QCOMPARE(ws.activeDocument(), a);
        QVERIFY(!ws.setActiveDocument("Missing"));

        QVERIFY(ws.closeDocument("Part"));
        QCOMPARE(ws.activeDocument(), b);
        QVERIFY(spy.count() >= 4);
    }

    void testCaptureViewport() {
        Workspace ws;
        Document* doc = ws.createDocument("Part");
        doc->add(makeBox("Box", 10, 10, 10));
        QImage img = ws.captureViewport(320, 200);
        QCOMPARE(img.size(), QSize(320, 200));
        QVERIFY(!img.isNull());
    }
};

QTEST_MAIN(TestScene)
#include "test_scene.moc"
