#include "BinaryNinjaHost.hpp"

#include <QApplication>
#include <QMainWindow>
#include <QWidget>

#include "binaryninjaapi.h"
#include "uicontext.h"
#include "viewframe.h"

namespace screenshotninja::plugin {

std::optional<std::string> BinaryNinjaHost::askSavePath(const std::string& prompt,
                                                        const std::string& extension,
                                                        const std::string& defaultName) {
    std::string result;
    if (!BinaryNinja::GetSaveFileNameInput(result, prompt, extension, defaultName)) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::int64_t> BinaryNinjaHost::askInteger(const std::string& prompt,
                                                        const std::string& title) {
    int64_t result = 0;
    if (!BinaryNinja::GetIntegerInput(result, prompt, title)) {
        return std::nullopt;
    }
    return result;
}

void BinaryNinjaHost::showError(const std::string& message) {
    BinaryNinja::ShowMessageBox("Error", message, OKButtonSet, ErrorIcon);
}

void BinaryNinjaHost::logInfo(const std::string& message) {
    BinaryNinja::LogInfo("%s", message.c_str());
}

void BinaryNinjaHost::logError(const std::string& message) {
    BinaryNinja::LogError("%s", message.c_str());
}

QWidget* BinaryNinjaHost::mainWindow() {
    if (QWidget* window = QApplication::activeWindow()) {
        return window;
    }

    // activeWindow() is null when the application does not have focus.
    UIContext* context = UIContext::activeContext();
    return context ? context->mainWindow() : nullptr;
}

QWidget* BinaryNinjaHost::activeView() {
    UIContext* context = UIContext::activeContext();
    if (!context) {
        return nullptr;
    }

    ViewFrame* frame = context->getCurrentViewFrame();
    if (!frame) {
        return nullptr;
    }

    return frame->getCurrentWidget();
}

} // namespace screenshotninja::plugin
