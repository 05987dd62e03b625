#include "scenerenderer.h"
#include "scene.h"
#include <QPainter>
#include <cmath>

namespace cadb {

namespace {

const QColor kGrid      (0xe4, 0xe7, 0xeb);
const QColor kAxisX     (0xd0, 0x40, 0x40);
const QColor kAxisY     (0x40, 0xa0, 0x40);
const QColor kFill      (0x9f, 0xb8, 0xd8, 160);
const QColor kOutline   (0x2d, 0x4a, 0x70);
const QColor kSelected  (0xf0, 0x9a, 0x20);

bool isRound(PrimitiveKind k) {
    return k == PrimitiveKind::Cylinder || k == PrimitiveKind::Sphere
        || k == PrimitiveKind::Cone || k == PrimitiveKind::Torus;
}

} // namespace

void renderScene(QPainter& p, const Document* doc, const QRect& target) {
    p.save();
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setClipRect(target);

    // World extent (XY) of everything visible, padded; default 100x100 around origin
    float minX = -50, minY = -50, maxX = 50, maxY = 50;
    bool any = false;
    if (doc) {
        for (const auto& o : doc->objects) {
            if (!o.visible) continue;
            BoundingBox bb = o.boundingBox();
            if (!any) {
                minX = bb.min.x(); minY = bb.min.y();
                maxX = bb.max.x(); maxY = bb.max.y();
                any = true;
            } else {
                minX = qMin(minX, bb.min.x()); minY = qMin(minY, bb.min.y());
                maxX = qMax(maxX, bb.max.x()); maxY = qMax(maxY, bb.max.y());
            }
        }
    }
    float spanX = qMax(maxX - minX, 1.0f), spanY = qMax(maxY - minY, 1.0f);
    minX -= spanX * 0.1f; maxX += spanX * 0.1f;
    minY -= spanY * 0.1f; maxY += spanY * 0.1f;

    const double sx = target.width()  / double(maxX - minX);
    const double sy = target.height() / double(maxY - minY);
    const double s  = qMin(sx, sy);
    const double ox = target.left() + (target.width()  - s * (maxX - minX)) / 2.0;
    const double oy = target.top()  + (target.height() - s * (maxY - minY)) / 2.0;
    // Y grows upward in world space
    auto map = [&](float x, float y) {
        return QPointF(ox + (x - minX) * s, oy + (maxY - y) * s);
    };

    // Grid every 10 units, axes through the origin
    p.setPen(QPen(kGrid, 1));
    for (int gx = int(std::floor(minX / 10)) * 10; gx <= maxX; gx += 10)
        p.drawLine(map(gx, minY), map(gx, maxY));
    for (int gy = int(std::floor(minY / 10)) * 10; gy <= maxY; gy += 10)
        p.drawLine(map(minX, gy), map(maxX, gy));
    p.setPen(QPen(kAxisX, 1.5));
    p.drawLine(map(minX, 0), map(maxX, 0));
    p.setPen(QPen(kAxisY, 1.5));
    p.drawLine(map(0, minY), map(0, maxY));

    if (doc) {
        for (const auto& o : doc->objects) {
            if (!o.visible) continue;
            bool selected = false;
            for (const QString& sel : doc->selection)
                if (sel.section('.', 0, 0) == o.name) { selected = true; break; }

            BoundingBox bb = o.boundingBox();
            QRectF r(map(bb.min.x(), bb.max.y()), map(bb.max.x(), bb.min.y()));
            p.setBrush(kFill);
            p.setPen(QPen(selected ? kSelected : kOutline, selected ? 2.5 : 1.2));
            if (isRound(o.kind)) {
                p.drawEllipse(r);
                if (o.kind == PrimitiveKind::Torus) {
                    // Hole of the ring
                    double inner = o.dims.radius - o.dims.radius2;
                    if (inner > 0) {
                        QPointF c = r.center();
                        p.setBrush(Qt::white);
                        p.drawEllipse(c, inner * s, inner * s);
                    }
                }
            } else {
                p.drawRect(r);
            }
        }
    }
    p.restore();
}

} // namespace cadb
