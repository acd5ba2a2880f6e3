#pragma once

#include "../CaptureHost.hpp"

namespace screenshotninja::plugin {

// CaptureHost backed by the running Binary Ninja UI: its dialogs, its log
// and its window/view-frame tree.
class BinaryNinjaHost : public CaptureHost {
public:
    BinaryNinjaHost() = default;

    std::optional<std::string> askSavePath(const std::string& prompt,
                                           const std::string& extension,
                                           const std::string& defaultName) override;
    std::optional<std::int64_t> askInteger(const std::string& prompt,
                                           const std::string& title) override;

    void showError(const std::string& message) override;
    void logInfo(const std::string& message) override;
    void logError(const std::string& message) override;

    QWidget* mainWindow() override;
    QWidget* activeView() override;
};

} // namespace screenshotninja::plugin
