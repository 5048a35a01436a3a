#include "injection/clipboard.h"
#include "injection_test_fakes.h"

#include <gtest/gtest.h>
#include <memory>

using namespace TextInjection;
using Status = Process::CommandResult::Status;

class CommandClipboardTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();

    CommandClipboard makeClipboard(PlatformFamily family) {
        return CommandClipboard(defaultClipboardCommands(family), runner,
                                std::chrono::milliseconds(200));
    }
};

TEST_F(CommandClipboardTest, ReadsWithFirstTool) {
    runner->setResult("wl-paste", Status::Ok, 0, "copied text");
    auto clipboard = makeClipboard(PlatformFamily::Wayland);

    auto content = clipboard.read();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "copied text");
    EXPECT_EQ(clipboard.name(), "wl-clipboard");

    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].timeout, std::chrono::milliseconds(200));
    EXPECT_TRUE(calls[0].captureOutput);
}

TEST_F(CommandClipboardTest, FallsBackWhenToolMissing) {
    // wl-paste is not installed; xclip answers
    runner->setResult("xclip", Status::Ok, 0, "from xclip");
    auto clipboard = makeClipboard(PlatformFamily::Wayland);

    auto content = clipboard.read();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "from xclip");
    EXPECT_EQ(clipboard.name(), "xclip");
    EXPECT_EQ(runner->calls().size(), 2u);
}

TEST_F(CommandClipboardTest, WorkingToolIsTriedFirstNextTime) {
    runner->setResult("xsel", Status::Ok, 0, "sel");
    auto clipboard = makeClipboard(PlatformFamily::X11);

    ASSERT_TRUE(clipboard.read().has_value());
    EXPECT_EQ(runner->calls().size(), 2u);

    ASSERT_TRUE(clipboard.write("next"));
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].argv.front(), "xsel");
}

TEST_F(CommandClipboardTest, WriteSendsTextOnStdinWithoutCapture) {
    runner->setResult("xclip", Status::Ok);
    auto clipboard = makeClipboard(PlatformFamily::X11);

    ASSERT_TRUE(clipboard.write("hello"));
    auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_TRUE(calls[0].input.has_value());
    EXPECT_EQ(*calls[0].input, "hello");
    EXPECT_FALSE(calls[0].captureOutput);
    EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"xclip", "-selection", "clipboard"}));
}

TEST_F(CommandClipboardTest, AllToolsFailing) {
    runner->setResult("xclip", Status::Failed, 1);
    runner->setResult("xsel", Status::TimedOut);
    auto clipboard = makeClipboard(PlatformFamily::X11);

    EXPECT_FALSE(clipboard.read().has_value());
    EXPECT_FALSE(clipboard.write("lost"));
}

TEST_F(CommandClipboardTest, EmptyToolListNeverSucceeds) {
    CommandClipboard clipboard({}, runner, std::chrono::milliseconds(100));
    EXPECT_EQ(clipboard.name(), "none");
    EXPECT_FALSE(clipboard.read().has_value());
    EXPECT_FALSE(clipboard.write("x"));
    EXPECT_TRUE(runner->calls().empty());
}

TEST(DefaultClipboardCommands, PerPlatform) {
    EXPECT_EQ(defaultClipboardCommands(PlatformFamily::Wayland).front().name, "wl-clipboard");
    EXPECT_EQ(defaultClipboardCommands(PlatformFamily::X11).front().name, "xclip");
    EXPECT_EQ(defaultClipboardCommands(PlatformFamily::MacOS).front().name, "pbcopy");
    EXPECT_EQ(defaultClipboardCommands(PlatformFamily::Windows).size(), 1u);
    EXPECT_EQ(defaultClipboardCommands(PlatformFamily::Unknown).size(), 3u);
}
