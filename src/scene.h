#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QVector3D>
#include <QJsonObject>
#include <QJsonArray>
#include <cstdint>

namespace cadb {

// ── Primitive kinds ──

enum class PrimitiveKind : uint8_t {
    Box, Cylinder, Sphere, Cone, Torus, Plane
};

struct PrimitiveMeta {
    PrimitiveKind kind;
    const char*   name;      // JSON / UI name
    const char*   typeId;    // host type identifier
};

inline constexpr PrimitiveMeta kPrimitiveMeta[] = {
    {PrimitiveKind::Box,      "Box",      "Part::Box"},
    {PrimitiveKind::Cylinder, "Cylinder", "Part::Cylinder"},
    {PrimitiveKind::Sphere,   "Sphere",   "Part::Sphere"},
    {PrimitiveKind::Cone,     "Cone",     "Part::Cone"},
    {PrimitiveKind::Torus,    "Torus",    "Part::Torus"},
    {PrimitiveKind::Plane,    "Plane",    "Part::Plane"},
};

inline constexpr const PrimitiveMeta* primitiveMeta(PrimitiveKind k) {
    for (const auto& m : kPrimitiveMeta)
        if (m.kind == k) return &m;
    return nullptr;
}

inline const char* primitiveToString(PrimitiveKind k) {
    auto* m = primitiveMeta(k);
    return m ? m->name : "Unknown";
}

inline PrimitiveKind primitiveFromString(const QString& s, bool* ok = nullptr) {
    for (const auto& m : kPrimitiveMeta) {
        if (s.compare(QLatin1String(m.name), Qt::CaseInsensitive) == 0) {
            if (ok) *ok = true;
            return m.kind;
        }
    }
    if (ok) *ok = false;
    return PrimitiveKind::Box;
}

// Box/Plane use length (x), width (y), height (z).
// Cylinder/Sphere use radius; Cone uses radius (base) and radius2 (top);
// Torus uses radius (major) and radius2 (minor).
struct Dimensions {
    double length  = 10.0;
    double width   = 10.0;
    double height  = 10.0;
    double radius  = 5.0;
    double radius2 = 2.0;

    QJsonObject toJson() const;
    static Dimensions fromJson(const QJsonObject& o, const Dimensions& base = {});
};

struct BoundingBox {
    QVector3D min;
    QVector3D max;

    QVector3D size()   const { return max - min; }
    QVector3D center() const { return (min + max) * 0.5f; }
    QJsonObject toJson() const;
};

struct FaceInfo {
    QString   name;          // "Face1", "Face2", ...
    QString   surface;       // "Plane", "Cylinder", "Sphere", "Cone", "Toroid"
    QVector3D centroid;
    double    area = 0.0;
    bool      hasNormal = false;
    QVector3D normal;        // planar faces only

    QJsonObject toJson() const;
};

// ── Scene object ──

struct SceneObject {
    QString       name;       // unique within a document
    QString       label;
    PrimitiveKind kind = PrimitiveKind::Box;
    QVector3D     position;
    QVector3D     rotation;   // Euler degrees, QQuaternion::fromEulerAngles order
    Dimensions    dims;
    bool          visible = true;

    double volume() const;
    double area() const;
    int    edgeCount() const;
    BoundingBox boundingBox() const;
    QVector<FaceInfo> faces() const;
    bool face(const QString& faceName, FaceInfo* out) const;

    QVector3D toWorld(const QVector3D& local) const;
    QVector3D rotateDirection(const QVector3D& dir) const;

    QJsonObject describe() const;    // computed descriptors for queries
    QJsonObject toJson() const;      // persisted fields only
    static SceneObject fromJson(const QJsonObject& o);
};

// ── Document ──

struct Document {
    QString              name;
    QString              filePath;
    QVector<SceneObject> objects;
    QStringList          selection;   // "Object" or "Object.FaceN"
    bool                 modified = false;

    int  indexOf(const QString& objectName) const;
    SceneObject*       find(const QString& objectName);
    const SceneObject* find(const QString& objectName) const;
    QString uniqueName(const QString& base) const;
    SceneObject& add(SceneObject obj);
    bool remove(const QString& objectName);

    QJsonObject toJson() const;
    static Document fromJson(const QJsonObject& o);
};

double round3(double v);
QJsonArray vecToJson(const QVector3D& v, int decimals = 3);
bool vecFromJson(const QJsonValue& v, QVector3D* out);

} // namespace cadb
