#include "WidgetCapture.hpp"

#include <QPoint>
#include <QRegion>
#include <QWidget>

namespace screenshotninja {

QSize scaledSize(const QRect& rect, int scale) {
    QRect scaled(rect);
    scaled.setWidth(rect.width() * scale);
    scaled.setHeight(rect.height() * scale);
    return scaled.size();
}

QPixmap renderWidget(QWidget& widget, int scale) {
    const QRect bounds = widget.rect();

    QPixmap pixmap(scaledSize(bounds, scale));
    pixmap.setDevicePixelRatio(scale);
    widget.render(&pixmap, QPoint(), QRegion(bounds));

    return pixmap;
}

} // namespace screenshotninja
