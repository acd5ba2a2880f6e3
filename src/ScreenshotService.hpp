#pragma once

#include <ctime>
#include <string>

class QWidget;

namespace screenshotninja {

class CaptureHost;

enum class CaptureTarget {
    View,
    Window,
};

inline constexpr auto kProductName = "Screenshot Ninja";
inline constexpr auto kScalePrompt = "Resolution multiplier:";
inline constexpr auto kSavePrompt = "Save Screenshot";
inline constexpr auto kImageExtension = "png";

// "binaryninja-<seconds since epoch>.png"
std::string defaultFilename(std::time_t now);

class ScreenshotService {
public:
    explicit ScreenshotService(CaptureHost& captureHost);

    bool captureView(int scale);
    bool captureWindow(int scale);

    // Ask for the multiplier first; cancelling the prompt aborts quietly.
    bool captureViewCustom();
    bool captureWindowCustom();

    bool capture(CaptureTarget target, int scale);
    bool captureCustom(CaptureTarget target);

    bool saveWidgetImage(QWidget& widget, int scale);

private:
    bool checkScale(long long scale);
    // Scale already validated by the caller.
    bool captureChecked(CaptureTarget target, int scale);

    CaptureHost& host;
};

} // namespace screenshotninja
