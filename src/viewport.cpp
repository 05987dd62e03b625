#include "viewport.h"
#include "scenerenderer.h"
#include "workspace.h"
#include <QPainter>

namespace cadb {

ViewportWidget::ViewportWidget(Workspace* workspace, QWidget* parent)
    : QWidget(parent), m_workspace(workspace)
{
    setObjectName("viewport");
    setAutoFillBackground(false);
    setMinimumSize(200, 150);
    connect(m_workspace, &Workspace::changed, this, qOverload<>(&QWidget::update));
}

void ViewportWidget::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.fillRect(rect(), Qt::white);
    renderScene(p, m_workspace->activeDocument(), rect());
}

} // namespace cadb
