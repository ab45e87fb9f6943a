#include <gtest/gtest.h>
#include "playback_launcher.hpp"
#include "test_support.hpp"

using Shio::Error;
using Shio::ErrorKind;
using Shio::PlayerCommand;

static Shio::StreamDescriptor stream(const std::string& url)
{
    Shio::StreamDescriptor descriptor;
    descriptor.url = url;
    descriptor.user_agent = "UA1";
    return descriptor;
}

TEST(PlayerCommandTest, SubstitutesPlaceholders)
{
    Error error;
    auto command = PlayerCommand::parse("mpv --user-agent={user_agent} {url}", error);

    ASSERT_TRUE(command.has_value()) << error.message;
    EXPECT_EQ(command->expand_to_string(stream("http://x/y.m3u8")),
              "mpv --user-agent=UA1 http://x/y.m3u8");
}

TEST(PlayerCommandTest, KeepsQuotedArgumentsTogether)
{
    Error error;
    auto command = PlayerCommand::parse("mpv '--force-media-title=My Show' --referrer={referer} {url}", error);
    ASSERT_TRUE(command.has_value()) << error.message;

    auto descriptor = stream("http://x/y.m3u8");
    descriptor.referer = "https://allmanga.to";
    auto argv = command->expand(descriptor);

    std::vector<std::string> expected = {
        "mpv", "--force-media-title=My Show", "--referrer=https://allmanga.to", "http://x/y.m3u8"
    };
    EXPECT_EQ(argv, expected);
}

TEST(PlayerCommandTest, DropsArgumentsThatExpandToNothing)
{
    Error error;
    auto command = PlayerCommand::parse("vlc {referer} {url}", error);
    ASSERT_TRUE(command.has_value());

    Shio::StreamDescriptor descriptor;
    descriptor.url = "http://x/y.mp4";
    auto argv = command->expand(descriptor);

    std::vector<std::string> expected = {"vlc", "http://x/y.mp4"};
    EXPECT_EQ(argv, expected);
}

TEST(PlayerCommandTest, MissingOptionalFieldLeavesPrefix)
{
    Error error;
    auto command = PlayerCommand::parse("mpv --user-agent={user_agent} {url}", error);
    ASSERT_TRUE(command.has_value());

    Shio::StreamDescriptor descriptor;
    descriptor.url = "http://x/y.m3u8";
    EXPECT_EQ(command->expand_to_string(descriptor), "mpv --user-agent= http://x/y.m3u8");
}

TEST(PlayerCommandTest, RejectsMalformedTemplates)
{
    const char* templates[] = {
        "",
        "mpv --fs",
        "mpv {title} {url}",
        "mpv {url",
        "mpv 'unterminated {url}",
        "{url}",
    };

    for (const char* tmpl : templates) {
        Error error;
        EXPECT_FALSE(PlayerCommand::parse(tmpl, error).has_value()) << tmpl;
        EXPECT_EQ(error.kind, ErrorKind::Launch) << tmpl;
    }
}

TEST(PlayerCommandTest, DefaultTemplateFollowsPlatform)
{
    g_autofree gchar* saved = g_strdup(g_getenv("PREFIX"));

    g_setenv("PREFIX", "/data/data/com.termux/files/usr", TRUE);
    EXPECT_EQ(PlayerCommand::default_template(), "termux-open {url} --content-type video");

    g_unsetenv("PREFIX");
    EXPECT_EQ(PlayerCommand::default_template(), "mpv {url}");

    if (saved) {
        g_setenv("PREFIX", saved, TRUE);
    }
}

TEST(PlaybackLauncherTest, MissingExecutableIsLaunchError)
{
    Error error;
    auto process = Shio::PlaybackLauncher::launch(stream("http://x/y.m3u8"),
                                                  "shio-test-no-such-player {url}", error);

    EXPECT_FALSE(process.has_value());
    EXPECT_EQ(error.kind, ErrorKind::Launch);
    EXPECT_NE(error.describe().find("shio-test-no-such-player"), std::string::npos);
}

TEST(PlaybackLauncherTest, InvalidTemplateIsLaunchError)
{
    Error error;
    auto process = Shio::PlaybackLauncher::launch(stream("http://x/y.m3u8"), "mpv --fs", error);

    EXPECT_FALSE(process.has_value());
    EXPECT_EQ(error.kind, ErrorKind::Launch);
}

TEST(PlaybackLauncherTest, SpawnsDetachedPlayer)
{
    Error error;
    auto process = Shio::PlaybackLauncher::launch(stream("http://x/y.m3u8"), "true {url}", error);

    ASSERT_TRUE(process.has_value()) << error.message;
    EXPECT_FALSE(process->identifier.empty());
    EXPECT_EQ(process->command_line, "true http://x/y.m3u8");

    // Let the child exit and be reaped
    ShioTest::run_until([] { return false; }, 200);
}
