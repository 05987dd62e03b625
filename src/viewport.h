#pragma once
#include <QWidget>

namespace cadb {

class Workspace;

// Top-down view of the active document. Repaints when the workspace changes.
class ViewportWidget : public QWidget {
    Q_OBJECT
public:
    explicit ViewportWidget(Workspace* workspace, QWidget* parent = nullptr);

    QSize sizeHint() const override { return QSize(800, 600); }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    Workspace* m_workspace;
};

} // namespace cadb
