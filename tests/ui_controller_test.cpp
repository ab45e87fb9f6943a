#include <gtest/gtest.h>
#include "ui/ui_controller.hpp"
#include "test_support.hpp"

using namespace ShioTest;
using Shio::KeyCode;
using Shio::KeyEvent;
using Shio::Stage;

using SearchOutcome = Outcome<std::vector<Shio::SearchResult>>;
using EpisodesOutcome = Outcome<std::vector<Shio::EpisodeRef>>;
using StreamOutcome = Outcome<Shio::StreamDescriptor>;

class UiControllerTest : public ::testing::Test
{
protected:
    std::shared_ptr<FakeAdapter> adapter = std::make_shared<FakeAdapter>("allanime:sub");
    RecordingLauncher launcher;
    Shio::ResolutionPipeline pipeline{
        {adapter}, Shio::PipelineOptions{Shio::SearchPolicy::FirstSuccess, 0, 0}};
    Shio::Session session{pipeline, launcher};
    FakeTerminal terminal;
    Shio::UiController controller{session, terminal};

    void SetUp() override
    {
        adapter->search_outcomes.push_back(SearchOutcome::success({
            make_result("allanime:sub", "n1", "Naruto"),
            make_result("allanime:sub", "n2", "Naruto: Shippuuden"),
            make_result("allanime:sub", "n3", "Boruto"),
        }));
        adapter->episode_outcomes.push_back(
            EpisodesOutcome::success(make_episodes("allanime:sub", "n2", 5)));
        adapter->stream_outcomes.push_back(StreamOutcome::success(make_stream("https://cdn.example.com/ep.m3u8")));
        ASSERT_TRUE(controller.start());
    }

    void type(const std::string& text)
    {
        for (char c : text) {
            controller.handle_key(KeyEvent::character(std::string(1, c)));
        }
    }

    void press(KeyCode code)
    {
        controller.handle_key(KeyEvent::key(code));
    }

    void search(const std::string& query)
    {
        type(query);
        press(KeyCode::Enter);
        ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::Results; }));
    }

    void open_second_title()
    {
        search("naruto");
        type("j");
        press(KeyCode::Enter);
        ASSERT_TRUE(run_until([&] {
            return session.get_stage() == Stage::EpisodeList && !session.get_state().episodes_loading;
        }));
    }
};

TEST_F(UiControllerTest, StartOpensTerminalAndDrawsPrompt)
{
    EXPECT_TRUE(terminal.is_open);
    ASSERT_FALSE(terminal.frames.empty());
    EXPECT_EQ(terminal.last_line(0), "shio | Search");
}

TEST_F(UiControllerTest, TypingEditsThePrompt)
{
    type("narutx");
    press(KeyCode::Backspace);
    type("o");

    EXPECT_EQ(controller.get_view().input, "naruto");
    EXPECT_EQ(terminal.last_line(1), "Search: naruto");
}

TEST_F(UiControllerTest, BackspaceRemovesWholeCharacter)
{
    controller.handle_key(KeyEvent::character("ナ"));
    controller.handle_key(KeyEvent::character("ル"));
    press(KeyCode::Backspace);

    EXPECT_EQ(controller.get_view().input, "ナ");
}

TEST_F(UiControllerTest, EnterSubmitsSearch)
{
    type("naruto");
    press(KeyCode::Enter);

    EXPECT_EQ(session.get_stage(), Stage::Searching);
    ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::Results; }));
    EXPECT_EQ(terminal.last_line(0), "shio | Results");
    EXPECT_EQ(controller.get_view().result_cursor, 0u);
}

TEST_F(UiControllerTest, BlankEnterDoesNothing)
{
    type("  ");
    press(KeyCode::Enter);

    EXPECT_EQ(session.get_stage(), Stage::Idle);
    EXPECT_EQ(adapter->search_calls, 0);
}

TEST_F(UiControllerTest, CursorMovesWithinBounds)
{
    search("naruto");

    type("k");
    EXPECT_EQ(controller.get_view().result_cursor, 0u);
    type("jjjj");
    EXPECT_EQ(controller.get_view().result_cursor, 2u);
    press(KeyCode::Home);
    EXPECT_EQ(controller.get_view().result_cursor, 0u);
    type("G");
    EXPECT_EQ(controller.get_view().result_cursor, 2u);
}

TEST_F(UiControllerTest, SelectingTitleAndEpisodeStartsPlayback)
{
    open_second_title();
    EXPECT_EQ(session.get_state().anime->id, "n2");
    EXPECT_EQ(controller.get_view().episode_cursor, 0u);

    press(KeyCode::Down);
    press(KeyCode::Down);
    press(KeyCode::Enter);
    ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::ReadyToPlay; }));

    ASSERT_EQ(launcher.launched.size(), 1u);
    EXPECT_EQ(adapter->resolved_episodes.back(), "3");

    type("n");
    ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::ReadyToPlay && launcher.launched.size() == 2; }));
    EXPECT_EQ(adapter->resolved_episodes.back(), "4");

    press(KeyCode::Escape);
    EXPECT_EQ(session.get_stage(), Stage::EpisodeList);
    EXPECT_EQ(controller.get_view().episode_cursor, 3u);
}

TEST_F(UiControllerTest, EscapeStepsBackToPrompt)
{
    open_second_title();

    press(KeyCode::Escape);
    EXPECT_EQ(session.get_stage(), Stage::Results);
    EXPECT_EQ(controller.get_view().result_cursor, 1u);

    type("h");
    EXPECT_EQ(session.get_stage(), Stage::Idle);
    EXPECT_EQ(controller.get_view().input, "naruto");
}

TEST_F(UiControllerTest, EscapeCancelsSearchInFlight)
{
    adapter->search_outcomes.front().delay_ms = 50;
    type("naruto");
    press(KeyCode::Enter);
    ASSERT_EQ(session.get_stage(), Stage::Searching);

    press(KeyCode::Escape);
    EXPECT_EQ(session.get_stage(), Stage::Idle);

    ASSERT_TRUE(run_until([&] { return adapter->pending() == 0; }));
    drain();
    EXPECT_EQ(session.get_stage(), Stage::Idle);
}

TEST_F(UiControllerTest, SlashStartsNewSearch)
{
    search("naruto");

    type("/");
    EXPECT_TRUE(controller.get_view().editing);
    EXPECT_EQ(controller.get_view().input, "naruto");

    for (int i = 0; i < 6; i++) {
        press(KeyCode::Backspace);
    }
    type("boruto");
    press(KeyCode::Enter);

    EXPECT_FALSE(controller.get_view().editing);
    EXPECT_EQ(session.get_state().query, "boruto");
}

TEST_F(UiControllerTest, ErrorCanBeRetriedWithR)
{
    adapter->search_outcomes.clear();
    adapter->search_outcomes.push_back(SearchOutcome::failure(
        Shio::Error::transport_error(Shio::TransportFailure::Timeout, "timed out")));
    adapter->search_outcomes.push_back(SearchOutcome::success({make_result("allanime:sub", "n1", "Naruto")}));

    type("naruto");
    press(KeyCode::Enter);
    ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::Error; }));
    EXPECT_NE(terminal.last_line(3).find("Request timed out"), std::string::npos);

    type("r");
    ASSERT_TRUE(run_until([&] { return session.get_stage() == Stage::Results; }));
    EXPECT_EQ(adapter->search_calls, 2);
}

TEST_F(UiControllerTest, QuitRestoresTerminal)
{
    int quits = 0;
    controller.on_quit([&]() { quits++; });

    search("naruto");
    type("q");

    EXPECT_TRUE(session.get_state().quit);
    EXPECT_EQ(quits, 1);
    EXPECT_FALSE(terminal.is_open);
    EXPECT_EQ(terminal.close_count, 1);
}

TEST_F(UiControllerTest, InterruptQuitsWhileEditing)
{
    int quits = 0;
    controller.on_quit([&]() { quits++; });

    type("nar");
    press(KeyCode::Interrupt);

    EXPECT_EQ(quits, 1);
    EXPECT_TRUE(session.get_state().quit);
}

TEST_F(UiControllerTest, EscapeOnEmptyPromptQuits)
{
    int quits = 0;
    controller.on_quit([&]() { quits++; });

    type("x");
    press(KeyCode::Escape);
    EXPECT_EQ(controller.get_view().input, "");
    EXPECT_EQ(quits, 0);

    press(KeyCode::Escape);
    EXPECT_EQ(quits, 1);
}

TEST(UiControllerStartTest, FailsWithoutTerminal)
{
    auto adapter = std::make_shared<FakeAdapter>("allanime:sub");
    RecordingLauncher launcher;
    Shio::ResolutionPipeline pipeline({adapter});
    Shio::Session session(pipeline, launcher);
    FakeTerminal terminal;
    terminal.open_result = false;

    Shio::UiController controller(session, terminal);
    EXPECT_FALSE(controller.start("naruto"));
    EXPECT_EQ(adapter->search_calls, 0);
}
