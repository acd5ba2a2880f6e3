#include "Commands.hpp"

namespace screenshotninja {
namespace {

constexpr std::array<ScreenshotCommand, 6> kScreenshotCommands{{
    {"Screenshot Ninja \\ Save view image @ 1x...",
     "Save an image of the currently visible linear/graph view at 1x scaling",
     CaptureTarget::View, 1},
    {"Screenshot Ninja \\ Save view image @ 2x...",
     "Save an image of the currently visible linear/graph view at 2x scaling",
     CaptureTarget::View, 2},
    {"Screenshot Ninja \\ Save view image...",
     "Save an image of the currently visible linear/graph view at custom scaling",
     CaptureTarget::View, 0},
    {"Screenshot Ninja \\ Save window image @ 1x...",
     "Save an image of the main window at 1x scaling",
     CaptureTarget::Window, 1},
    {"Screenshot Ninja \\ Save window image @ 2x...",
     "Save an image of the main window at 2x scaling",
     CaptureTarget::Window, 2},
    {"Screenshot Ninja \\ Save window image...",
     "Save an image of the main window at custom scaling",
     CaptureTarget::Window, 0},
}};

} // namespace

const std::array<ScreenshotCommand, 6>& screenshotCommands() {
    return kScreenshotCommands;
}

bool runCommand(ScreenshotService& service, const ScreenshotCommand& command) {
    if (command.scale == 0) {
        return service.captureCustom(command.target);
    }
    return service.capture(command.target, command.scale);
}

} // namespace screenshotninja
