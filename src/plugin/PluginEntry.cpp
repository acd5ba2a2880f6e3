#include "binaryninjaapi.h"
#include "uicontext.h"

#include "../Commands.hpp"
#include "../ScreenshotService.hpp"
#include "BinaryNinjaHost.hpp"

using namespace BinaryNinja;

extern "C" {

BN_DECLARE_UI_ABI_VERSION

BINARYNINJAPLUGIN bool UIPluginInit() {
    for (const auto& command : screenshotninja::screenshotCommands()) {
        PluginCommand::Register(command.name, command.description,
                                [&command](BinaryView* /*view*/) {
                                    screenshotninja::plugin::BinaryNinjaHost host;
                                    screenshotninja::ScreenshotService service(host);
                                    screenshotninja::runCommand(service, command);
                                });
    }

    LogInfo("%s: registered %zu commands", screenshotninja::kProductName,
            screenshotninja::screenshotCommands().size());
    return true;
}

} // extern "C"
