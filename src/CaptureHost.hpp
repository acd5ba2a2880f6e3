#pragma once

#include <cstdint>
#include <optional>
#include <string>

class QWidget;

namespace screenshotninja {

// Everything the surrounding application supplies to a capture: widget
// lookup, user prompts, the error dialog and the log sink.
class CaptureHost {
public:
    virtual ~CaptureHost() = default;

    // Returns std::nullopt when the user cancels the dialog.
    virtual std::optional<std::string> askSavePath(const std::string& prompt,
                                                   const std::string& extension,
                                                   const std::string& defaultName) = 0;
    virtual std::optional<std::int64_t> askInteger(const std::string& prompt,
                                                   const std::string& title) = 0;

    virtual void showError(const std::string& message) = 0;
    virtual void logInfo(const std::string& message) = 0;
    virtual void logError(const std::string& message) = 0;

    // Both may return nullptr when nothing suitable is open.
    virtual QWidget* mainWindow() = 0;
    virtual QWidget* activeView() = 0;
};

} // namespace screenshotninja
