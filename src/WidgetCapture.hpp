#pragma once

#include <QPixmap>
#include <QRect>
#include <QSize>

class QWidget;

namespace screenshotninja {

// Size of `rect` with both dimensions multiplied by `scale`.
QSize scaledSize(const QRect& rect, int scale);

// Renders the whole of `widget` into a pixmap whose device pixel ratio is
// `scale`, so the widget paints at `scale` times its logical resolution.
QPixmap renderWidget(QWidget& widget, int scale);

} // namespace screenshotninja
