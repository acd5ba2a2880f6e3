#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <QWidget>

#include <string>

#include "Commands.hpp"
#include "MockCaptureHost.hpp"

using namespace screenshotninja;
using screenshotninja::testing::MockCaptureHost;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

TEST(CommandTableTest, RegistersSixCommandsInMenuOrder) {
    const auto& commands = screenshotCommands();
    ASSERT_EQ(commands.size(), 6u);

    EXPECT_STREQ(commands[0].name, "Screenshot Ninja \\ Save view image @ 1x...");
    EXPECT_STREQ(commands[1].name, "Screenshot Ninja \\ Save view image @ 2x...");
    EXPECT_STREQ(commands[2].name, "Screenshot Ninja \\ Save view image...");
    EXPECT_STREQ(commands[3].name, "Screenshot Ninja \\ Save window image @ 1x...");
    EXPECT_STREQ(commands[4].name, "Screenshot Ninja \\ Save window image @ 2x...");
    EXPECT_STREQ(commands[5].name, "Screenshot Ninja \\ Save window image...");
}

TEST(CommandTableTest, TargetsAndScales) {
    const auto& commands = screenshotCommands();

    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(commands[i].target, CaptureTarget::View) << commands[i].name;
        EXPECT_EQ(commands[i + 3].target, CaptureTarget::Window) << commands[i + 3].name;
        EXPECT_EQ(commands[i].scale, commands[i + 3].scale);
    }
    EXPECT_EQ(commands[0].scale, 1);
    EXPECT_EQ(commands[1].scale, 2);
    EXPECT_EQ(commands[2].scale, 0);
}

TEST(CommandTableTest, DescriptionsNameTargetAndScaling) {
    for (const auto& command : screenshotCommands()) {
        const std::string description = command.description;
        const std::string subject = command.target == CaptureTarget::View
                                        ? "currently visible linear/graph view"
                                        : "main window";
        const std::string scaling =
            command.scale == 0 ? "custom scaling" : std::to_string(command.scale) + "x scaling";

        EXPECT_THAT(description, ::testing::StartsWith("Save an image of the "));
        EXPECT_THAT(description, ::testing::HasSubstr(subject));
        EXPECT_THAT(description, ::testing::EndsWith(scaling));
    }
}

TEST(RunCommandTest, FixedScaleCommandSkipsMultiplierPrompt) {
    NiceMock<MockCaptureHost> host;
    ScreenshotService service(host);
    QWidget window;
    window.resize(10, 10);

    EXPECT_CALL(host, askInteger(_, _)).Times(0);
    EXPECT_CALL(host, mainWindow()).WillOnce(Return(&window));
    EXPECT_CALL(host, askSavePath(_, _, _)).WillOnce(Return(std::nullopt));

    EXPECT_FALSE(runCommand(service, screenshotCommands()[4]));
}

TEST(RunCommandTest, ViewCommandLooksUpActiveView) {
    NiceMock<MockCaptureHost> host;
    ScreenshotService service(host);

    EXPECT_CALL(host, activeView()).WillOnce(Return(nullptr));
    EXPECT_CALL(host, mainWindow()).Times(0);
    EXPECT_CALL(host, showError("Couldn't find active view."));

    EXPECT_FALSE(runCommand(service, screenshotCommands()[0]));
}

TEST(RunCommandTest, CustomCommandPromptsForMultiplier) {
    NiceMock<MockCaptureHost> host;
    ScreenshotService service(host);

    EXPECT_CALL(host, askInteger("Resolution multiplier:", "Screenshot Ninja"))
        .WillOnce(Return(std::nullopt));
    EXPECT_CALL(host, activeView()).Times(0);
    EXPECT_CALL(host, showError(_)).Times(0);

    EXPECT_FALSE(runCommand(service, screenshotCommands()[2]));
}
