#include <QtTest/QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include "operations.h"
#include "executor.h"
#include "workspace.h"

using namespace cadb;

class TestOperations : public QObject {
    Q_OBJECT

    OperationRegistry* m_reg = nullptr;
    CommandExecutor*   m_exec = nullptr;
    Workspace*         m_ws = nullptr;
    uint64_t           m_nextId = 1;

    Result run(const QString& method, const QJsonObject& params = {}) {
        return m_exec->execute(Command::structured(m_nextId++, method, params), *m_ws);
    }

    QJsonObject value(const QString& method, const QJsonObject& params = {}) {
        Result r = run(method, params);
        if (!r.ok())
            qWarning() << method << "failed:" << errorKindToString(r.errorKind) << r.errorMessage;
        return r.value.toObject();
    }

private slots:
    void init() {
        m_reg = new OperationRegistry;
        registerBuiltinOperations(*m_reg);
        m_exec = new CommandExecutor(*m_reg);
        m_ws = new Workspace;
    }

    void cleanup() {
        delete m_ws;
        delete m_exec;
        delete m_reg;
    }

    // ── Registry ──

    void testRegistryRejectsDuplicates() {
        QVERIFY(m_reg->contains("ping"));
        QVERIFY(!m_reg->add({"ping", "again", {}, false, nullptr}));
        QCOMPARE(m_reg->names().count("ping"), 1);
    }

    void testValidation() {
        ValidationResult v = m_reg->validate("no_such_op", {});
        QVERIFY(!v.ok);
        QCOMPARE(v.kind, ErrorKind::UnknownMethod);

        v = m_reg->validate("create_primitive", {});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);
        QVERIFY(v.error.contains("shape"));

        v = m_reg->validate("create_primitive", {{"shape", "Box"}, {"position", QJsonArray{1, 2}}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);
        QVERIFY(v.error.contains("vector3"));

        v = m_reg->validate("create_primitive", {{"shape", "Box"}, {"colour", "red"}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);
        QVERIFY(v.error.contains("colour"));

        v = m_reg->validate("get_screenshot", {{"width", 12.5}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);

        // Integers must fit an int
        v = m_reg->validate("get_screenshot", {{"width", 1e19}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);
        v = m_reg->validate("get_screenshot", {{"width", 5e9}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);
        v = m_reg->validate("get_screenshot", {{"height", -1e300}});
        QCOMPARE(v.kind, ErrorKind::InvalidArguments);

        QVERIFY(m_reg->validate("create_primitive", {{"shape", "Box"}}).ok);
        QVERIFY(m_reg->validate("get_screenshot", {{"width", 320}}).ok);
    }

    void testDescribeSchema() {
        QJsonObject d = m_reg->find("measure_distance")->describe();
        QCOMPARE(d.value("name").toString(), QString("measure_distance"));
        QJsonObject schema = d.value("inputSchema").toObject();
        QCOMPARE(schema.value("required").toArray().size(), 2);
        QCOMPARE(schema.value("properties").toObject().value("from").toObject()
                     .value("type").toString(), QString("string"));
    }

    void testListOperations() {
        QJsonArray ops = value("list_operations").value("operations").toArray();
        QStringList names;
        for (const auto& o : ops) names << o.toObject().value("name").toString();
        QVERIFY(names.contains("create_primitive"));
        QVERIFY(names.contains("execute"));
        QVERIFY(names.contains("get_screenshot"));
    }

    // ── Documents ──

    void testPingNeedsNoDocument() {
        QJsonObject v = value("ping");
        QVERIFY(v.value("pong").toBool());
        QCOMPARE(v.value("documents").toInt(), 0);
        QCOMPARE(m_ws->documentCount(), 0);
    }

    void testDocuments() {
        QCOMPARE(value("new_document", {{"name", "Bracket"}}).value("document").toString(),
                 QString("Bracket"));
        value("new_document", {{"name", "Plate"}});

        QJsonObject list = value("list_documents");
        QCOMPARE(list.value("documents").toArray().size(), 2);
        QCOMPARE(list.value("active").toString(), QString("Plate"));

        QVERIFY(run("set_active_document", {{"name", "Bracket"}}).ok());
        QCOMPARE(m_ws->activeDocument()->name, QString("Bracket"));

        Result r = run("set_active_document", {{"name", "Nope"}});
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QVERIFY(r.errorMessage.contains("Nope"));
    }

    void testAutoCreatesDocument() {
        QVERIFY(run("create_primitive", {{"shape", "Box"}}).ok());
        QCOMPARE(m_ws->documentCount(), 1);
        QCOMPARE(m_ws->activeDocument()->name, QString("Unnamed"));
    }

    void testNoActiveContextWithoutAutoCreate() {
        m_exec->setAutoCreateDocument(false);
        Result r = run("get_model_info");
        QVERIFY(!r.ok());
        QCOMPARE(r.errorKind, ErrorKind::NoActiveContext);
        QCOMPARE(m_ws->documentCount(), 0);
    }

    // ── Geometry ──

    void testCreatePrimitive() {
        QJsonObject box = value("create_primitive", {
            {"shape", "Box"}, {"name", "Base"},
            {"position", QJsonArray{1, 2, 3}},
            {"dimensions", QJsonObject{{"length", 20}, {"width", 10}, {"height", 5}}}});
        QCOMPARE(box.value("name").toString(), QString("Base"));
        QCOMPARE(box.value("type").toString(), QString("Part::Box"));
        QCOMPARE(box.value("position").toArray(), (QJsonArray{1, 2, 3}));
        QCOMPARE(box.value("dimensions").toObject().value("volume").toDouble(), 1000.0);

        // Names are made unique
        QCOMPARE(value("create_primitive", {{"shape", "Box"}, {"name", "Base"}})
                     .value("name").toString(), QString("Base001"));
        QVERIFY(m_ws->activeDocument()->modified);
    }

    void testCreatePrimitiveRejectsBadInput() {
        Result r = run("create_primitive", {{"shape", "Wedge"}});
        QCOMPARE(r.errorKind, ErrorKind::InvalidArguments);

        r = run("create_primitive", {{"shape", "Sphere"},
                                     {"dimensions", QJsonObject{{"radius", -1}}}});
        QCOMPARE(r.errorKind, ErrorKind::InvalidArguments);
        QVERIFY(r.errorMessage.contains("radius"));

        r = run("create_primitive", {{"shape", "Torus"},
                                     {"dimensions", QJsonObject{{"radius", 2}, {"radius2", 3}}}});
        QCOMPARE(r.errorKind, ErrorKind::InvalidArguments);
        QCOMPARE(m_ws->activeDocument()->objects.size(), 0);
    }

    void testTransformAndDelete() {
        value("create_primitive", {{"shape", "Cylinder"}, {"name", "Pin"}});
        QJsonObject t = value("transform_object", {{"object_name", "Pin"},
                                                   {"position", QJsonArray{10, 0, 0}},
                                                   {"translate", QJsonArray{0, 5, 0}}});
        QCOMPARE(t.value("position").toArray(), (QJsonArray{10, 5, 0}));

        Result missing = run("transform_object", {{"object_name", "Ghost"}});
        QCOMPARE(missing.errorKind, ErrorKind::ExecutionError);
        QVERIFY(missing.errorMessage.contains("Ghost"));

        QCOMPARE(value("delete_object", {{"object_name", "Pin"}}).value("deleted").toString(),
                 QString("Pin"));
        QCOMPARE(run("delete_object", {{"object_name", "Pin"}}).errorKind, ErrorKind::ExecutionError);
    }

    // ── Queries ──

    void testModelInfo() {
        value("create_primitive", {{"shape", "Box"}, {"name", "A"}});
        value("create_primitive", {{"shape", "Sphere"}, {"name", "B"}});

        QJsonObject all = value("get_model_info");
        QCOMPARE(all.value("objects").toArray().size(), 2);

        QJsonObject one = value("get_model_info", {{"object_name", "B"}});
        QCOMPARE(one.value("objects").toArray().size(), 1);
        QCOMPARE(one.value("objects").toArray()[0].toObject().value("type").toString(),
                 QString("Part::Sphere"));

        QCOMPARE(run("get_model_info", {{"object_name", "C"}}).errorKind, ErrorKind::ExecutionError);
    }

    void testSelection() {
        value("create_primitive", {{"shape", "Box"}, {"name", "Box"}});
        value("create_primitive", {{"shape", "Cone"}, {"name", "Tip"}});

        QJsonObject sel = value("select", {{"object_name", "Box"},
                                           {"sub_elements", QJsonArray{"Face1", "Face6"}}});
        QCOMPARE(sel.value("selection").toArray().size(), 2);

        value("select", {{"object_name", "Tip"}, {"clear", false}});

        QJsonObject got = value("get_selection");
        QCOMPARE(got.value("count").toInt(), 2);
        QJsonObject first = got.value("entities").toArray()[0].toObject();
        QCOMPARE(first.value("object").toString(), QString("Box"));
        QCOMPARE(first.value("sub_elements").toArray().size(), 2);
        QCOMPARE(first.value("sub_elements").toArray()[1].toObject().value("name").toString(),
                 QString("Face6"));
        QJsonObject second = got.value("entities").toArray()[1].toObject();
        QCOMPARE(second.value("type").toString(), QString("Part::Cone"));
        QVERIFY(!second.contains("sub_elements"));

        Result bad = run("select", {{"object_name", "Box"}, {"sub_elements", QJsonArray{"Face9"}}});
        QCOMPARE(bad.errorKind, ErrorKind::InvalidArguments);

        value("select", {});
        QCOMPARE(value("get_selection").value("count").toInt(), 0);
    }

    void testFacesAndDistance() {
        value("create_primitive", {{"shape", "Box"}, {"name", "Box"},
                                   {"dimensions", QJsonObject{{"length", 10}, {"width", 10}, {"height", 10}}}});
        QJsonArray faces = value("get_faces", {{"object_name", "Box"}}).value("faces").toArray();
        QCOMPARE(faces.size(), 6);
        QCOMPARE(faces[5].toObject().value("normal").toArray(), (QJsonArray{0, 0, 1}));

        QJsonObject d = value("measure_distance", {{"from", "Box.Face5"}, {"to", "Box.Face6"}});
        QCOMPARE(d.value("distance").toDouble(), 10.0);

        d = value("measure_distance", {{"from", "Box"}, {"to", "Box.Face2"}});
        QCOMPARE(d.value("distance").toDouble(), 5.0);

        QCOMPARE(run("measure_distance", {{"from", "Box.Face9"}, {"to", "Box"}}).errorKind,
                 ErrorKind::ExecutionError);
    }

    void testScreenshot() {
        value("create_primitive", {{"shape", "Box"}});
        QJsonObject shot = value("get_screenshot", {{"width", 64}, {"height", 48}});
        QCOMPARE(shot.value("width").toInt(), 64);
        QCOMPARE(shot.value("height").toInt(), 48);
        QCOMPARE(shot.value("format").toString(), QString("png"));
        QByteArray png = QByteArray::fromBase64(shot.value("image_base64").toString().toLatin1());
        QVERIFY(png.startsWith("\x89PNG"));

        QCOMPARE(run("get_screenshot", {{"width", 8}}).errorKind, ErrorKind::InvalidArguments);
    }

    // ── Persistence ──

    void testSaveAndOpen() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("part.cadb");

        value("new_document", {{"name", "Part"}});
        value("create_primitive", {{"shape", "Torus"}, {"name", "Ring"},
                                   {"dimensions", QJsonObject{{"radius", 6}, {"radius2", 1}}}});

        QCOMPARE(run("save_document").errorKind, ErrorKind::InvalidArguments);
        QCOMPARE(value("save_document", {{"path", path}}).value("path").toString(), path);
        QVERIFY(!m_ws->activeDocument()->modified);

        QJsonObject opened = value("open_document", {{"path", path}});
        QCOMPARE(opened.value("document").toString(), QString("Part1"));
        QCOMPARE(opened.value("objects").toInt(), 1);
        Document* doc = m_ws->activeDocument();
        QCOMPARE(doc->filePath, path);
        QVERIFY(!doc->modified);
        QCOMPARE(doc->find("Ring")->dims.radius2, 1.0);

        Result missing = run("open_document", {{"path", dir.filePath("missing.cadb")}});
        QCOMPARE(missing.errorKind, ErrorKind::ExecutionError);
    }

    void testOpenRejectsInvalidObjects() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto box = [](const QString& name, double length) {
            return QJsonObject{{"name", name}, {"kind", "Box"},
                               {"dimensions", QJsonObject{{"length", length}, {"width", 1}, {"height", 1}}}};
        };
        auto write = [&](const QString& file, const QJsonArray& objects) {
            QString path = dir.filePath(file);
            QFile f(path);
            if (!f.open(QIODevice::WriteOnly)) return QString();
            f.write(QJsonDocument(QJsonObject{{"name", "Bad"}, {"objects", objects}}).toJson());
            return path;
        };

        const QStringList files = {
            write("dup.cadb",   QJsonArray{box("Box", 1), box("Box", 2)}),
            write("empty.cadb", QJsonArray{box("", 1)}),
            write("dot.cadb",   QJsonArray{box("Box.Face1", 1)}),
            write("neg.cadb",   QJsonArray{box("Box", -1)}),
            write("torus.cadb", QJsonArray{QJsonObject{{"name", "Ring"}, {"kind", "Torus"},
                                   {"dimensions", QJsonObject{{"radius", 1}, {"radius2", 2}}}}}),
            write("kind.cadb",  QJsonArray{QJsonObject{{"name", "Blob"}, {"kind", "Blob"}}})
        };
        const int docs = m_ws->documentCount();
        for (const QString& path : files) {
            Result r = run("open_document", {{"path", path}});
            QVERIFY2(r.errorKind == ErrorKind::ExecutionError, qPrintable(path));
            QVERIFY(r.errorMessage.startsWith("Invalid document"));
        }
        QCOMPARE(m_ws->documentCount(), docs);

        Result ok = run("open_document", {{"path", write("good.cadb", QJsonArray{box("A", 1), box("B", 2)})}});
        QVERIFY2(ok.ok(), qPrintable(ok.errorMessage));
        QVERIFY(m_ws->activeDocument()->find("B"));
        QVERIFY(run("delete_object", {{"object_name", "A"}}).ok());
        QVERIFY(!m_ws->activeDocument()->find("A"));
    }

    void testCreatePrimitiveRejectsDottedName() {
        Result r = run("create_primitive", {{"shape", "Box"}, {"name", "Box.Face1"}});
        QCOMPARE(r.errorKind, ErrorKind::InvalidArguments);
        r = run("create_primitive", {{"shape", "Box"}, {"name", " "}});
        QCOMPARE(r.errorKind, ErrorKind::InvalidArguments);
    }

    void testSaveFailureKeepsModified() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        value("new_document", {{"name", "Part"}});
        value("create_primitive", {{"shape", "Box"}});
        QVERIFY(m_ws->activeDocument()->modified);

        Result r = run("save_document", {{"path", dir.filePath("no/such/dir/part.cadb")}});
        QCOMPARE(r.errorKind, ErrorKind::ExecutionError);
        QVERIFY(m_ws->activeDocument()->modified);
        QVERIFY(m_ws->activeDocument()->filePath.isEmpty());
    }
};

QTEST_MAIN(TestOperations)
#include "test_operations.moc"
