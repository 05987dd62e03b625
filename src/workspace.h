#pragma once
#include "hostcontext.h"
#include "scene.h"
#include <QObject>
#include <memory>
#include <vector>

namespace cadb {

// In-memory document set of the reference host.
class Workspace : public QObject, public HostContext {
    Q_OBJECT
public:
    explicit Workspace(QObject* parent = nullptr);
    ~Workspace() override;

    Document*          activeDocument() override;
    QVector<Document*> documents() override;
    Document*          createDocument(const QString& name) override;
    bool               setActiveDocument(const QString& name) override;
    QImage             captureViewport(int width, int height) override;
    void               documentChanged(Document* doc) override;

    Document* findDocument(const QString& name);
    bool      closeDocument(const QString& name);
    int       documentCount() const { return int(m_docs.size()); }

signals:
    void changed();

private:
    std::vector<std::unique_ptr<Document>> m_docs;
    Document* m_active = nullptr;

    QString uniqueDocumentName(const QString& base) const;
};

} // namespace cadb
