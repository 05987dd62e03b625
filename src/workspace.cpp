#include "workspace.h"
#include "scenerenderer.h"
#include <QPainter>
#include <QDebug>

namespace cadb {

Workspace::Workspace(QObject* parent) : QObject(parent) {}

Workspace::~Workspace() = default;

Document* Workspace::activeDocument() {
    return m_active;
}

QVector<Document*> Workspace::documents() {
    QVector<Document*> out;
    for (auto& d : m_docs) out.append(d.get());
    return out;
}

Document* Workspace::findDocument(const QString& name) {
    for (auto& d : m_docs)
        if (d->name == name) return d.get();
    return nullptr;
}

QString Workspace::uniqueDocumentName(const QString& base) const {
    QString stem = base.isEmpty() ? QStringLiteral("Unnamed") : base;
    auto taken = [this](const QString& n) {
        for (const auto& d : m_docs)
            if (d->name == n) return true;
        return false;
    };
    if (!taken(stem)) return stem;
    for (int i = 1;; i++) {
        QString candidate = stem + QString::number(i);
        if (!taken(candidate)) return candidate;
    }
}

Document* Workspace::createDocument(const QString& name) {
    auto doc = std::make_unique<Document>();
    doc->name = uniqueDocumentName(name);
    m_active = doc.get();
    m_docs.push_back(std::move(doc));
    qDebug() << "[Workspace] Created document" << m_active->name;
    emit changed();
    return m_active;
}

bool Workspace::setActiveDocument(const QString& name) {
    Document* d = findDocument(name);
    if (!d) return false;
    m_active = d;
    emit changed();
    return true;
}

bool Workspace::closeDocument(const QString& name) {
    for (auto it = m_docs.begin(); it != m_docs.end(); ++it) {
        if ((*it)->name != name) continue;
        bool wasActive = it->get() == m_active;
        m_docs.erase(it);
        if (wasActive)
            m_active = m_docs.empty() ? nullptr : m_docs.back().get();
        emit changed();
        return true;
    }
    return false;
}

QImage Workspace::captureViewport(int width, int height) {
    QImage img(width, height, QImage::Format_ARGB32);
    img.fill(Qt::white);
    QPainter p(&img);
    renderScene(p, m_active, QRect(0, 0, width, height));
    return img;
}

void Workspace::documentChanged(Document* doc) {
    if (doc) doc->modified = true;
    emit changed();
}

} // namespace cadb
