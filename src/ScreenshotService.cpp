#include "ScreenshotService.hpp"

#include <QPixmap>
#include <QString>
#include <QWidget>

#include <optional>

#include "CaptureHost.hpp"
#include "WidgetCapture.hpp"

namespace screenshotninja {
namespace {

// Keeps width * scale well inside int range for any realistic widget.
constexpr long long kMaxScale = 32;

} // namespace

std::string defaultFilename(std::time_t now) {
    return "binaryninja-" + std::to_string(static_cast<long long>(now)) + ".png";
}

ScreenshotService::ScreenshotService(CaptureHost& captureHost) : host(captureHost) {}

bool ScreenshotService::captureView(int scale) {
    return capture(CaptureTarget::View, scale);
}

bool ScreenshotService::captureWindow(int scale) {
    return capture(CaptureTarget::Window, scale);
}

bool ScreenshotService::captureViewCustom() {
    return captureCustom(CaptureTarget::View);
}

bool ScreenshotService::captureWindowCustom() {
    return captureCustom(CaptureTarget::Window);
}

bool ScreenshotService::capture(CaptureTarget target, int scale) {
    if (!checkScale(scale)) {
        return false;
    }
    return captureChecked(target, scale);
}

bool ScreenshotService::captureChecked(CaptureTarget target, int scale) {
    QWidget* widget = nullptr;
    const char* missing = nullptr;
    switch (target) {
    case CaptureTarget::View:
        widget = host.activeView();
        missing = "Couldn't find active view.";
        break;
    case CaptureTarget::Window:
        widget = host.mainWindow();
        missing = "Couldn't find main window.";
        break;
    }

    if (!widget) {
        host.logError(missing);
        host.showError(missing);
        return false;
    }

    return saveWidgetImage(*widget, scale);
}

bool ScreenshotService::captureCustom(CaptureTarget target) {
    const std::optional<std::int64_t> scale = host.askInteger(kScalePrompt, kProductName);
    if (!scale) {
        return false;
    }
    if (!checkScale(*scale)) {
        return false;
    }
    return captureChecked(target, static_cast<int>(*scale));
}

bool ScreenshotService::saveWidgetImage(QWidget& widget, int scale) {
    const QPixmap image = renderWidget(widget, scale);

    const std::optional<std::string> savePath =
        host.askSavePath(kSavePrompt, kImageExtension, defaultFilename(std::time(nullptr)));
    if (!savePath) {
        return false;
    }

    if (!image.isNull() && image.save(QString::fromStdString(*savePath), "PNG")) {
        host.logInfo("Screenshot saved to " + *savePath + " successfully.");
        return true;
    }

    host.logError("Failed to save screenshot to " + *savePath);
    host.showError("Failed to save screenshot.");
    return false;
}

bool ScreenshotService::checkScale(long long scale) {
    if (scale >= 1 && scale <= kMaxScale) {
        return true;
    }

    const std::string message =
        "Resolution multiplier must be between 1 and " + std::to_string(kMaxScale) + ".";
    host.logError(message);
    host.showError(message);
    return false;
}

} // namespace screenshotninja
