#pragma once

#include <array>

#include "ScreenshotService.hpp"

namespace screenshotninja {

struct ScreenshotCommand {
    const char* name;
    const char* description;
    CaptureTarget target;
    int scale; // 0 prompts for a multiplier
};

const std::array<ScreenshotCommand, 6>& screenshotCommands();

bool runCommand(ScreenshotService& service, const ScreenshotCommand& command);

} // namespace screenshotninja
