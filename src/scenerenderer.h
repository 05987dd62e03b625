#pragma once
#include <QRect>

class QPainter;

namespace cadb {

struct Document;

// Top-down (XY) orthographic rendering of a document, fitted to `target`.
// Shared by the viewport widget and the screenshot capture.
void renderScene(QPainter& p, const Document* doc, const QRect& target);

} // namespace cadb
