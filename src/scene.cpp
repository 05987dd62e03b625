#include "scene.h"
#include <QQuaternion>
#include <QtMath>
#include <cmath>
#include <limits>

namespace cadb {

double round3(double v) {
    return std::round(v * 1000.0) / 1000.0;
}

QJsonArray vecToJson(const QVector3D& v, int decimals) {
    const double f = std::pow(10.0, decimals);
    auto r = [f](float x) { return std::round(double(x) * f) / f; };
    return QJsonArray{r(v.x()), r(v.y()), r(v.z())};
}

bool vecFromJson(const QJsonValue& v, QVector3D* out) {
    if (!v.isArray()) return false;
    QJsonArray a = v.toArray();
    if (a.size() != 3) return false;
    for (const auto& e : a)
        if (!e.isDouble()) return false;
    *out = QVector3D(float(a[0].toDouble()), float(a[1].toDouble()), float(a[2].toDouble()));
    return true;
}

// ── Dimensions ──

QJsonObject Dimensions::toJson() const {
    return QJsonObject{
        {"length",  length},
        {"width",   width},
        {"height",  height},
        {"radius",  radius},
        {"radius2", radius2}
    };
}

Dimensions Dimensions::fromJson(const QJsonObject& o, const Dimensions& base) {
    Dimensions d = base;
    d.length  = o.value("length").toDouble(d.length);
    d.width   = o.value("width").toDouble(d.width);
    d.height  = o.value("height").toDouble(d.height);
    d.radius  = o.value("radius").toDouble(d.radius);
    d.radius2 = o.value("radius2").toDouble(d.radius2);
    return d;
}

QJsonObject BoundingBox::toJson() const {
    return QJsonObject{
        {"x", QJsonArray{round3(min.x()), round3(max.x())}},
        {"y", QJsonArray{round3(min.y()), round3(max.y())}},
        {"z", QJsonArray{round3(min.z()), round3(max.z())}}
    };
}

QJsonObject FaceInfo::toJson() const {
    QJsonObject o{
        {"name",     name},
        {"surface",  surface},
        {"centroid", vecToJson(centroid)},
        {"area",     round3(area)}
    };
    if (hasNormal)
        o["normal"] = vecToJson(normal);
    return o;
}

// ── SceneObject ──

QVector3D SceneObject::rotateDirection(const QVector3D& dir) const {
    return QQuaternion::fromEulerAngles(rotation).rotatedVector(dir);
}

QVector3D SceneObject::toWorld(const QVector3D& local) const {
    return rotateDirection(local) + position;
}

double SceneObject::volume() const {
    const Dimensions& d = dims;
    switch (kind) {
    case PrimitiveKind::Box:      return d.length * d.width * d.height;
    case PrimitiveKind::Cylinder: return M_PI * d.radius * d.radius * d.height;
    case PrimitiveKind::Sphere:   return 4.0 / 3.0 * M_PI * std::pow(d.radius, 3);
    case PrimitiveKind::Cone:
        return M_PI * d.height / 3.0
             * (d.radius * d.radius + d.radius * d.radius2 + d.radius2 * d.radius2);
    case PrimitiveKind::Torus:    return 2.0 * M_PI * M_PI * d.radius * d.radius2 * d.radius2;
    case PrimitiveKind::Plane:    return 0.0;
    }
    return 0.0;
}

double SceneObject::area() const {
    double total = 0.0;
    for (const FaceInfo& f : faces())
        total += f.area;
    return total;
}

int SceneObject::edgeCount() const {
    switch (kind) {
    case PrimitiveKind::Box:      return 12;
    case PrimitiveKind::Cylinder: return 3;
    case PrimitiveKind::Sphere:   return 3;
    case PrimitiveKind::Cone:     return dims.radius2 > 0.0 ? 3 : 2;
    case PrimitiveKind::Torus:    return 2;
    case PrimitiveKind::Plane:    return 4;
    }
    return 0;
}

BoundingBox SceneObject::boundingBox() const {
    const Dimensions& d = dims;
    QVector3D lo, hi;
    switch (kind) {
    case PrimitiveKind::Box:
        lo = {0, 0, 0};
        hi = {float(d.length), float(d.width), float(d.height)};
        break;
    case PrimitiveKind::Plane:
        lo = {0, 0, 0};
        hi = {float(d.length), float(d.width), 0};
        break;
    case PrimitiveKind::Cylinder:
        lo = {-float(d.radius), -float(d.radius), 0};
        hi = { float(d.radius),  float(d.radius), float(d.height)};
        break;
    case PrimitiveKind::Cone: {
        float r = float(qMax(d.radius, d.radius2));
        lo = {-r, -r, 0};
        hi = { r,  r, float(d.height)};
        break;
    }
    case PrimitiveKind::Sphere: {
        float r = float(d.radius);
        lo = {-r, -r, -r};
        hi = { r,  r,  r};
        break;
    }
    case PrimitiveKind::Torus: {
        float r = float(d.radius + d.radius2);
        lo = {-r, -r, -float(d.radius2)};
        hi = { r,  r,  float(d.radius2)};
        break;
    }
    }

    // Rotate the eight local corners and take the world-aligned extent.
    const float inf = std::numeric_limits<float>::infinity();
    BoundingBox bb{{inf, inf, inf}, {-inf, -inf, -inf}};
    for (int i = 0; i < 8; i++) {
        QVector3D c((i & 1) ? hi.x() : lo.x(),
                    (i & 2) ? hi.y() : lo.y(),
                    (i & 4) ? hi.z() : lo.z());
        QVector3D w = toWorld(c);
        bb.min = QVector3D(qMin(bb.min.x(), w.x()), qMin(bb.min.y(), w.y()), qMin(bb.min.z(), w.z()));
        bb.max = QVector3D(qMax(bb.max.x(), w.x()), qMax(bb.max.y(), w.y()), qMax(bb.max.z(), w.z()));
    }
    return bb;
}

QVector<FaceInfo> SceneObject::faces() const {
    const Dimensions& d = dims;
    QVector<FaceInfo> out;

    auto planar = [&](const QVector3D& c, const QVector3D& n, double a) {
        FaceInfo f;
        f.surface   = QStringLiteral("Plane");
        f.centroid  = toWorld(c);
        f.normal    = rotateDirection(n).normalized();
        f.hasNormal = true;
        f.area      = a;
        out.append(f);
    };
    auto curved = [&](const char* surface, const QVector3D& c, double a) {
        FaceInfo f;
        f.surface  = QString::fromLatin1(surface);
        f.centroid = toWorld(c);
        f.area     = a;
        out.append(f);
    };

    const float L = float(d.length), W = float(d.width), H = float(d.height);
    switch (kind) {
    case PrimitiveKind::Box:
        planar({0,     W / 2, H / 2}, {-1, 0, 0}, d.width * d.height);
        planar({L,     W / 2, H / 2}, { 1, 0, 0}, d.width * d.height);
        planar({L / 2, 0,     H / 2}, {0, -1, 0}, d.length * d.height);
        planar({L / 2, W,     H / 2}, {0,  1, 0}, d.length * d.height);
        planar({L / 2, W / 2, 0    }, {0, 0, -1}, d.length * d.width);
        planar({L / 2, W / 2, H    }, {0, 0,  1}, d.length * d.width);
        break;
    case PrimitiveKind::Plane:
        planar({L / 2, W / 2, 0}, {0, 0, 1}, d.length * d.width);
        break;
    case PrimitiveKind::Cylinder:
        curved("Cylinder", {0, 0, H / 2}, 2.0 * M_PI * d.radius * d.height);
        planar({0, 0, H}, {0, 0,  1}, M_PI * d.radius * d.radius);
        planar({0, 0, 0}, {0, 0, -1}, M_PI * d.radius * d.radius);
        break;
    case PrimitiveKind::Sphere:
        curved("Sphere", {0, 0, 0}, 4.0 * M_PI * d.radius * d.radius);
        break;
    case PrimitiveKind::Cone: {
        const double r1 = d.radius, r2 = d.radius2;
        const double slant = std::sqrt((r1 - r2) * (r1 - r2) + d.height * d.height);
        const double zc = (r1 + r2) > 0.0 ? d.height * (r1 + 2.0 * r2) / (3.0 * (r1 + r2)) : 0.0;
        curved("Cone", {0, 0, float(zc)}, M_PI * (r1 + r2) * slant);
        if (r2 > 0.0)
            planar({0, 0, H}, {0, 0, 1}, M_PI * r2 * r2);
        planar({0, 0, 0}, {0, 0, -1}, M_PI * r1 * r1);
        break;
    }
    case PrimitiveKind::Torus:
        curved("Toroid", {0, 0, 0}, 4.0 * M_PI * M_PI * d.radius * d.radius2);
        break;
    }

    for (int i = 0; i < out.size(); i++)
        out[i].name = QStringLiteral("Face%1").arg(i + 1);
    return out;
}

bool SceneObject::face(const QString& faceName, FaceInfo* out) const {
    for (const FaceInfo& f : faces()) {
        if (f.name == faceName) {
            if (out) *out = f;
            return true;
        }
    }
    return false;
}

QJsonObject SceneObject::describe() const {
    BoundingBox bb = boundingBox();
    QVector3D ext = bb.size();
    QJsonObject o{
        {"name",     name},
        {"label",    label},
        {"type",     primitiveMeta(kind)->typeId},
        {"visible",  visible},
        {"position", vecToJson(position)},
        {"rotation", vecToJson(rotation)},
        {"bounds",   bb.toJson()},
        {"edges",    edgeCount()},
        {"faces",    faces().size()}
    };
    o["dimensions"] = QJsonObject{
        {"length", round3(ext.x())},
        {"width",  round3(ext.y())},
        {"height", round3(ext.z())},
        {"volume", round3(volume())},
        {"area",   round3(area())}
    };
    return o;
}

QJsonObject SceneObject::toJson() const {
    return QJsonObject{
        {"name",       name},
        {"label",      label},
        {"kind",       primitiveToString(kind)},
        {"position",   vecToJson(position, 6)},
        {"rotation",   vecToJson(rotation, 6)},
        {"dimensions", dims.toJson()},
        {"visible",    visible}
    };
}

SceneObject SceneObject::fromJson(const QJsonObject& o) {
    SceneObject s;
    s.name    = o.value("name").toString();
    s.label   = o.value("label").toString(s.name);
    s.kind    = primitiveFromString(o.value("kind").toString());
    vecFromJson(o.value("position"), &s.position);
    vecFromJson(o.value("rotation"), &s.rotation);
    s.dims    = Dimensions::fromJson(o.value("dimensions").toObject());
    s.visible = o.value("visible").toBool(true);
    return s;
}

// ── Document ──

int Document::indexOf(const QString& objectName) const {
    for (int i = 0; i < objects.size(); i++)
        if (objects[i].name == objectName) return i;
    return -1;
}

SceneObject* Document::find(const QString& objectName) {
    int i = indexOf(objectName);
    return i >= 0 ? &objects[i] : nullptr;
}

const SceneObject* Document::find(const QString& objectName) const {
    int i = indexOf(objectName);
    return i >= 0 ? &objects[i] : nullptr;
}

QString Document::uniqueName(const QString& base) const {
    QString stem = base.isEmpty() ? QStringLiteral("Object") : base;
    if (indexOf(stem) < 0) return stem;
    for (int n = 1;; n++) {
        QString candidate = stem + QStringLiteral("%1").arg(n, 3, 10, QChar('0'));
        if (indexOf(candidate) < 0) return candidate;
    }
}

SceneObject& Document::add(SceneObject obj) {
    obj.name = uniqueName(obj.name);
    if (obj.label.isEmpty()) obj.label = obj.name;
    objects.append(obj);
    modified = true;
    return objects.last();
}

bool Document::remove(const QString& objectName) {
    int i = indexOf(objectName);
    if (i < 0) return false;
    objects.removeAt(i);
    // Drop selection entries that pointed at the removed object
    QStringList kept;
    for (const QString& s : selection)
        if (s.section('.', 0, 0) != objectName) kept.append(s);
    selection = kept;
    modified = true;
    return true;
}

QJsonObject Document::toJson() const {
    QJsonArray arr;
    for (const auto& o : objects) arr.append(o.toJson());
    return QJsonObject{
        {"format",  "cadbridge-document"},
        {"version", 1},
        {"name",    name},
        {"objects", arr}
    };
}

Document Document::fromJson(const QJsonObject& o) {
    Document d;
    d.name = o.value("name").toString();
    for (const auto& v : o.value("objects").toArray())
        d.objects.append(SceneObject::fromJson(v.toObject()));
    return d;
}

} // namespace cadb
