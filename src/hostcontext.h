#pragma once
#include <QImage>
#include <QString>
#include <QVector>

namespace cadb {

struct Document;

// The host's live session state as seen by the bridge. Implemented by the
// host application; only ever touched on the UI thread.
class HostContext {
public:
    virtual ~HostContext() = default;

    virtual Document*          activeDocument() = 0;
    virtual QVector<Document*> documents() = 0;
    virtual Document*          createDocument(const QString& name) = 0;
    virtual bool               setActiveDocument(const QString& name) = 0;

    // Renders the active document's view into an image.
    virtual QImage captureViewport(int width, int height) = 0;

    // Called after an operation mutated a document, so the host can redraw.
    virtual void documentChanged(Document* doc) { Q_UNUSED(doc); }
};

} // namespace cadb
