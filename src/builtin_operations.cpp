#include "operations.h"
#include "hostcontext.h"
#include "scene.h"
#include <QBuffer>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QSet>
#include <cmath>

namespace cadb {

namespace {

// ── Helpers ──

Document* requireDocument(HostContext& host) {
    Document* doc = host.activeDocument();
    if (!doc) throw OperationError(ErrorKind::NoActiveContext, QStringLiteral("No active document"));
    return doc;
}

SceneObject& requireObject(Document* doc, const QString& name) {
    SceneObject* obj = doc->find(name);
    if (!obj) throw OperationError(QStringLiteral("Object not found: %1").arg(name));
    return *obj;
}

QVector3D vecArg(const QJsonObject& args, const char* key, const QVector3D& fallback = {}) {
    QVector3D v = fallback;
    vecFromJson(args.value(QLatin1String(key)), &v);
    return v;
}

void checkDimensions(PrimitiveKind kind, const Dimensions& d) {
    auto positive = [](double v, const char* what) {
        if (!(v > 0.0) || !std::isfinite(v))
            throw OperationError(ErrorKind::InvalidArguments,
                                 QStringLiteral("%1 must be a positive number").arg(QLatin1String(what)));
    };
    switch (kind) {
    case PrimitiveKind::Box:
        positive(d.length, "length"); positive(d.width, "width"); positive(d.height, "height");
        break;
    case PrimitiveKind::Plane:
        positive(d.length, "length"); positive(d.width, "width");
        break;
    case PrimitiveKind::Cylinder:
        positive(d.radius, "radius"); positive(d.height, "height");
        break;
    case PrimitiveKind::Sphere:
        positive(d.radius, "radius");
        break;
    case PrimitiveKind::Cone:
        positive(d.radius, "radius"); positive(d.height, "height");
        if (d.radius2 < 0.0)
            throw OperationError(ErrorKind::InvalidArguments, QStringLiteral("radius2 must not be negative"));
        break;
    case PrimitiveKind::Torus:
        positive(d.radius, "radius"); positive(d.radius2, "radius2");
        if (d.radius2 >= d.radius)
            throw OperationError(ErrorKind::InvalidArguments,
                                 QStringLiteral("radius2 (minor) must be smaller than radius (major)"));
        break;
    }
}

// '.' separates an object from its sub-element ("Box.Face2")
void checkObjectName(const QString& name) {
    if (name.trimmed().isEmpty())
        throw OperationError(ErrorKind::InvalidArguments, QStringLiteral("Object name must not be empty"));
    if (name.contains(QLatin1Char('.')))
        throw OperationError(ErrorKind::InvalidArguments,
                             QStringLiteral("Object name must not contain '.': %1").arg(name));
}

// "Box" → object center, "Box.Face2" → face centroid
QVector3D referencePoint(Document* doc, const QString& ref) {
    QString objName = ref.section('.', 0, 0);
    QString sub     = ref.section('.', 1);
    const SceneObject& obj = requireObject(doc, objName);
    if (sub.isEmpty())
        return obj.boundingBox().center();
    FaceInfo f;
    if (!obj.face(sub, &f))
        throw OperationError(QStringLiteral("%1 has no sub-element %2").arg(objName, sub));
    return f.centroid;
}

QJsonObject documentSummary(Document* d, Document* active) {
    return QJsonObject{
        {"name",     d->name},
        {"objects",  d->objects.size()},
        {"active",   d == active},
        {"modified", d->modified},
        {"filePath", d->filePath}
    };
}

} // namespace

void registerBuiltinOperations(OperationRegistry& registry) {

    // ── Session ──

    registry.add({"ping", "Round-trip through the host UI thread.", {}, false,
        [](const QJsonObject&, HostContext& host) -> QJsonValue {
            return QJsonObject{{"pong", true}, {"documents", host.documents().size()}};
        }});

    registry.add({"list_operations", "List structured operations and their parameters.", {}, false,
        [&registry](const QJsonObject&, HostContext&) -> QJsonValue {
            return QJsonObject{{"operations", registry.describe()}};
        }});

    registry.add({"execute",
        "Run Lua code in the persistent session. print() output is captured; "
        "the host is reachable through cad.call(name, args).",
        {{"code", ParamType::String, true, "Lua source"}},
        true, nullptr});

    // ── Documents ──

    registry.add({"new_document", "Create a document and make it active.",
        {{"name", ParamType::String, false, "Document name"}}, false,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* d = host.createDocument(args.value("name").toString("Unnamed"));
            return QJsonObject{{"document", d->name}};
        }});

    registry.add({"list_documents", "List open documents.", {}, false,
        [](const QJsonObject&, HostContext& host) -> QJsonValue {
            Document* active = host.activeDocument();
            QJsonArray arr;
            for (Document* d : host.documents())
                arr.append(documentSummary(d, active));
            return QJsonObject{
                {"documents", arr},
                {"active", active ? QJsonValue(active->name) : QJsonValue()}
            };
        }});

    registry.add({"set_active_document", "Activate an open document by name.",
        {{"name", ParamType::String, true, "Document name"}}, false,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            QString name = args.value("name").toString();
            if (!host.setActiveDocument(name))
                throw OperationError(QStringLiteral("Document not found: %1").arg(name));
            return QJsonObject{{"document", name}};
        }});

    // ── Geometry creation / editing ──

    registry.add({"create_primitive",
        "Create a primitive solid (Box, Cylinder, Sphere, Cone, Torus, Plane).",
        {{"shape",      ParamType::String,  true,  "Primitive kind"},
         {"name",       ParamType::String,  false, "Object name (made unique)"},
         {"position",   ParamType::Vector3, false, "Placement [x, y, z]"},
         {"rotation",   ParamType::Vector3, false, "Euler angles in degrees [x, y, z]"},
         {"dimensions", ParamType::Object,  false, "length/width/height/radius/radius2"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            bool ok = false;
            QString shape = args.value("shape").toString();
            PrimitiveKind kind = primitiveFromString(shape, &ok);
            if (!ok)
                throw OperationError(ErrorKind::InvalidArguments, QStringLiteral("Unknown shape: %1").arg(shape));

            SceneObject obj;
            obj.kind     = kind;
            obj.name     = args.value("name").toString(QString::fromLatin1(primitiveToString(kind)));
            checkObjectName(obj.name);
            obj.position = vecArg(args, "position");
            obj.rotation = vecArg(args, "rotation");
            obj.dims     = Dimensions::fromJson(args.value("dimensions").toObject());
            checkDimensions(kind, obj.dims);

            SceneObject& added = doc->add(obj);
            QJsonObject out = added.describe();
            host.documentChanged(doc);
            return out;
        }});

    registry.add({"transform_object", "Set or offset an object's placement.",
        {{"object_name", ParamType::String,  true,  "Target object"},
         {"position",    ParamType::Vector3, false, "Absolute position"},
         {"rotation",    ParamType::Vector3, false, "Absolute Euler angles (degrees)"},
         {"translate",   ParamType::Vector3, false, "Relative offset applied after position"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            SceneObject& obj = requireObject(doc, args.value("object_name").toString());
            obj.position  = vecArg(args, "position", obj.position);
            obj.rotation  = vecArg(args, "rotation", obj.rotation);
            obj.position += vecArg(args, "translate");
            QJsonObject out = obj.describe();
            host.documentChanged(doc);
            return out;
        }});

    registry.add({"delete_object", "Remove an object from the active document.",
        {{"object_name", ParamType::String, true, "Target object"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            QString name = args.value("object_name").toString();
            if (!doc->remove(name))
                throw OperationError(QStringLiteral("Object not found: %1").arg(name));
            host.documentChanged(doc);
            return QJsonObject{{"deleted", name}};
        }});

    // ── Queries ──

    registry.add({"get_model_info", "Objects and dimensions of the active document.",
        {{"object_name", ParamType::String, false, "Only this object"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            QString target = args.value("object_name").toString();
            QJsonArray objs;
            for (const auto& o : doc->objects) {
                if (!target.isEmpty() && o.name != target) continue;
                objs.append(o.describe());
            }
            if (!target.isEmpty() && objs.isEmpty())
                throw OperationError(QStringLiteral("Object not found: %1").arg(target));
            return QJsonObject{{"document", doc->name}, {"objects", objs}};
        }});

    registry.add({"select", "Set the selection to an object and optional sub-elements.",
        {{"object_name",  ParamType::String,  false, "Object to select"},
         {"sub_elements", ParamType::Array,   false, "Face names, e.g. [\"Face1\"]"},
         {"clear",        ParamType::Boolean, false, "Clear the selection first (default true)"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            if (args.value("clear").toBool(true))
                doc->selection.clear();
            QString name = args.value("object_name").toString();
            if (!name.isEmpty()) {
                const SceneObject& obj = requireObject(doc, name);
                QJsonArray subs = args.value("sub_elements").toArray();
                if (subs.isEmpty() && !doc->selection.contains(name))
                    doc->selection.append(name);
                for (const auto& s : subs) {
                    QString sub = s.toString();
                    if (!obj.face(sub, nullptr))
                        throw OperationError(ErrorKind::InvalidArguments,
                                             QStringLiteral("%1 has no sub-element %2").arg(name, sub));
                    QString entry = name + '.' + sub;
                    if (!doc->selection.contains(entry))
                        doc->selection.append(entry);
                }
            }
            host.documentChanged(doc);
            return QJsonObject{{"selection", QJsonArray::fromStringList(doc->selection)}};
        }});

    registry.add({"get_selection", "Selected objects and faces with descriptors.", {}, true,
        [](const QJsonObject&, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            // Group "Obj" / "Obj.FaceN" entries per object, in selection order
            QStringList order;
            QHash<QString, QStringList> subsByObject;
            for (const QString& s : doc->selection) {
                QString obj = s.section('.', 0, 0);
                if (!subsByObject.contains(obj)) {
                    order.append(obj);
                    subsByObject.insert(obj, {});
                }
                QString sub = s.section('.', 1);
                if (!sub.isEmpty()) subsByObject[obj].append(sub);
            }
            QJsonArray entities;
            for (const QString& name : order) {
                const SceneObject* obj = doc->find(name);
                if (!obj) continue;
                QJsonObject e{{"object", name}, {"type", primitiveMeta(obj->kind)->typeId}};
                QJsonArray subs;
                for (const QString& sub : subsByObject.value(name)) {
                    FaceInfo f;
                    if (obj->face(sub, &f)) subs.append(f.toJson());
                    else subs.append(QJsonObject{{"name", sub}, {"error", "no such sub-element"}});
                }
                if (!subs.isEmpty()) e["sub_elements"] = subs;
                entities.append(e);
            }
            return QJsonObject{{"entities", entities}, {"count", entities.size()}};
        }});

    registry.add({"get_faces", "Enumerate an object's faces with centroid, area and normal.",
        {{"object_name", ParamType::String, true, "Target object"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            const SceneObject& obj = requireObject(doc, args.value("object_name").toString());
            QJsonArray arr;
            for (const FaceInfo& f : obj.faces()) arr.append(f.toJson());
            return QJsonObject{{"object", obj.name}, {"faces", arr}};
        }});

    registry.add({"measure_distance",
        "Distance between two references (\"Obj\" = center, \"Obj.FaceN\" = face centroid).",
        {{"from", ParamType::String, true, "First reference"},
         {"to",   ParamType::String, true, "Second reference"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            QVector3D a = referencePoint(doc, args.value("from").toString());
            QVector3D b = referencePoint(doc, args.value("to").toString());
            return QJsonObject{
                {"from",     vecToJson(a)},
                {"to",       vecToJson(b)},
                {"delta",    vecToJson(b - a)},
                {"distance", round3((b - a).length())}
            };
        }});

    // ── Capture ──

    registry.add({"get_screenshot", "Capture the active view as a base64 PNG.",
        {{"width",  ParamType::Integer, false, "Pixels (16-4096, default 800)"},
         {"height", ParamType::Integer, false, "Pixels (16-4096, default 600)"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            int w = args.value("width").toInt(800);
            int h = args.value("height").toInt(600);
            if (w < 16 || w > 4096 || h < 16 || h > 4096)
                throw OperationError(ErrorKind::InvalidArguments,
                                     QStringLiteral("width and height must be within 16..4096"));
            QImage img = host.captureViewport(w, h);
            if (img.isNull())
                throw OperationError(QStringLiteral("No active view"));
            QByteArray png;
            QBuffer buf(&png);
            buf.open(QIODevice::WriteOnly);
            if (!img.save(&buf, "PNG"))
                throw OperationError(QStringLiteral("PNG encoding failed"));
            return QJsonObject{
                {"image_base64", QString::fromLatin1(png.toBase64())},
                {"width",  img.width()},
                {"height", img.height()},
                {"format", "png"}
            };
        }});

    // ── Persistence ──

    registry.add({"save_document", "Write the active document as JSON.",
        {{"path", ParamType::String, false, "Target file (default: the document's path)"}},
        true,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            Document* doc = requireDocument(host);
            QString path = args.value("path").toString(doc->filePath);
            if (path.isEmpty())
                throw OperationError(ErrorKind::InvalidArguments,
                                     QStringLiteral("Document has no file path; pass 'path'"));
            QSaveFile f(path);
            if (!f.open(QIODevice::WriteOnly))
                throw OperationError(QStringLiteral("Cannot write %1: %2").arg(path, f.errorString()));
            QByteArray data = QJsonDocument(doc->toJson()).toJson(QJsonDocument::Indented);
            if (f.write(data) != data.size() || !f.commit())
                throw OperationError(QStringLiteral("Cannot write %1: %2").arg(path, f.errorString()));
            doc->filePath = path;
            doc->modified = false;
            return QJsonObject{{"document", doc->name}, {"path", path}};
        }});

    registry.add({"open_document", "Load a JSON document and make it active.",
        {{"path", ParamType::String, true, "Source file"}},
        false,
        [](const QJsonObject& args, HostContext& host) -> QJsonValue {
            QString path = args.value("path").toString();
            QFile f(path);
            if (!f.open(QIODevice::ReadOnly))
                throw OperationError(QStringLiteral("Cannot read %1: %2").arg(path, f.errorString()));
            QJsonParseError perr;
            QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &perr);
            if (!jd.isObject())
                throw OperationError(QStringLiteral("Invalid document %1: %2").arg(path, perr.errorString()));

            // Check every object before touching the workspace
            const QJsonArray raw = jd.object().value("objects").toArray();
            Document loaded = Document::fromJson(jd.object());
            QSet<QString> seen;
            for (int i = 0; i < loaded.objects.size(); i++) {
                const SceneObject& o = loaded.objects[i];
                try {
                    bool known = false;
                    primitiveFromString(raw.at(i).toObject().value("kind").toString(), &known);
                    if (!known)
                        throw OperationError(QStringLiteral("unknown kind '%1'")
                                                 .arg(raw.at(i).toObject().value("kind").toString()));
                    checkObjectName(o.name);
                    if (seen.contains(o.name))
                        throw OperationError(QStringLiteral("duplicate object name"));
                    seen.insert(o.name);
                    checkDimensions(o.kind, o.dims);
                } catch (const OperationError& e) {
                    throw OperationError(QStringLiteral("Invalid document %1: object %2 ('%3'): %4")
                                             .arg(path).arg(i).arg(o.name, e.message()));
                }
            }

            QString name = loaded.name.isEmpty() ? QFileInfo(path).baseName() : loaded.name;
            Document* doc = host.createDocument(name);
            for (const SceneObject& o : loaded.objects)
                doc->add(o);
            doc->filePath = path;
            host.documentChanged(doc);
            doc->modified = false;
            return QJsonObject{{"document", doc->name}, {"objects", doc->objects.size()}};
        }});
}

} // namespace cadb
