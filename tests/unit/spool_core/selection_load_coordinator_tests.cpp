#include <gtest/gtest.h>

#include "fakes.hpp"
#include "spool/log.hpp"
#include "spool/viewer/render_materializer.hpp"
#include "spool/viewer/selection_load_coordinator.hpp"
#include "spool/viewer/ui_queue.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using spool::mail::LoadError;
using spool::mail::LoadOutcome;
using spool::testing::makeEntry;
using spool::testing::makeMessage;
using spool::testing::ManualContentLoader;
using spool::viewer::DisplayState;
using spool::viewer::SelectionLoadCoordinator;
using spool::viewer::SessionState;
using spool::viewer::UiQueue;
using spool::viewer::ViewState;

namespace
{

struct CapturingLog
{
    spool::log::Logger logger;
    std::vector<std::pair<spool::log::Level, std::string>> lines;

    CapturingLog()
    {
        logger.setMinimumLevel(spool::log::Level::Debug);
        logger.setSink([this](spool::log::Level level, const std::string &line) { lines.emplace_back(level, line); });
    }

    bool contains(spool::log::Level level, const std::string &needle) const
    {
        for (const auto &[lineLevel, line] : lines)
        {
            if (lineLevel == level && line.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }
};

class SelectionLoadCoordinatorTest : public ::testing::Test
{
protected:
    SelectionLoadCoordinatorTest()
        : coordinator(loader, queue, nullptr, log.logger)
    {
        coordinator.setDisplayChangedCallback([this](const DisplayState &state) { history.push_back(state); });
    }

    ManualContentLoader loader;
    UiQueue queue;
    CapturingLog log;
    SelectionLoadCoordinator coordinator;
    std::vector<DisplayState> history;
};

} // namespace

TEST_F(SelectionLoadCoordinatorTest, SelectingEntryEntersLoading)
{
    coordinator.select(makeEntry("a", 1));

    ASSERT_EQ(loader.requests.size(), 1u);
    EXPECT_EQ(coordinator.state(), ViewState::Loading);
    const auto &display = coordinator.display();
    EXPECT_EQ(display.title, spool::viewer::kLoadingTitle);
    EXPECT_TRUE(display.loading);
    EXPECT_FALSE(display.deleteEnabled);
    EXPECT_FALSE(display.forwardEnabled);
    ASSERT_NE(coordinator.activeSession(), nullptr);
    EXPECT_EQ(coordinator.activeSession()->state, SessionState::Pending);
}

TEST_F(SelectionLoadCoordinatorTest, CompletionIsAppliedOnlyWhenQueueDrains)
{
    coordinator.select(makeEntry("a", 1));
    loader.complete(0, LoadOutcome::success(makeMessage("Hello", "body")));

    EXPECT_EQ(coordinator.state(), ViewState::Loading);
    EXPECT_EQ(queue.pending(), 1u);

    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_EQ(coordinator.state(), ViewState::Rendered);
    const auto &display = coordinator.display();
    EXPECT_EQ(display.title, "Hello");
    EXPECT_EQ(display.subject, "Hello");
    EXPECT_EQ(display.from, "sender@example.com");
    EXPECT_EQ(display.body, "body");
    EXPECT_FALSE(display.bodyIsHtml);
    EXPECT_FALSE(display.textTabVisible);
    EXPECT_TRUE(display.deleteEnabled);
    EXPECT_TRUE(display.forwardEnabled);
    EXPECT_TRUE(display.contentEnabled);
    EXPECT_FALSE(display.loading);
    EXPECT_NE(display.headers.find("Subject: Hello"), std::string::npos);
}

TEST_F(SelectionLoadCoordinatorTest, EmptySubjectUsesNeutralTitle)
{
    coordinator.select(makeEntry("a", 1));
    loader.complete(0, LoadOutcome::success(makeMessage("", "body")));
    queue.drain();
    EXPECT_EQ(coordinator.display().title, spool::viewer::kNeutralTitle);
}

TEST_F(SelectionLoadCoordinatorTest, SupersededDeliveryIsDiscarded)
{
    coordinator.select(makeEntry("m1", 1));
    coordinator.select(makeEntry("m2", 2));
    EXPECT_TRUE(loader.cancelled(0));

    // The first fetch finished anyway; its result must not be shown.
    loader.forceComplete(0, LoadOutcome::success(makeMessage("from m1", "one")));
    queue.drain();
    EXPECT_EQ(coordinator.state(), ViewState::Loading);
    EXPECT_EQ(coordinator.discardedDeliveries(), 1u);

    loader.complete(1, LoadOutcome::success(makeMessage("from m2", "two")));
    queue.drain();
    EXPECT_EQ(coordinator.display().title, "from m2");
    for (const auto &state : history)
        EXPECT_NE(state.title, "from m1");
}

TEST_F(SelectionLoadCoordinatorTest, LateDeliveryAfterNewerCompletionIsDiscarded)
{
    coordinator.select(makeEntry("m1", 1));
    coordinator.select(makeEntry("m2", 2));

    loader.complete(1, LoadOutcome::success(makeMessage("from m2", "two")));
    loader.forceComplete(0, LoadOutcome::success(makeMessage("from m1", "one")));
    queue.drain();

    EXPECT_EQ(coordinator.state(), ViewState::Rendered);
    EXPECT_EQ(coordinator.display().title, "from m2");
    EXPECT_EQ(coordinator.discardedDeliveries(), 1u);
    EXPECT_TRUE(log.contains(spool::log::Level::Debug, "stale"));
}

TEST_F(SelectionLoadCoordinatorTest, SecondDeliveryForSameSessionIsDiscarded)
{
    coordinator.select(makeEntry("a", 1));
    loader.forceComplete(0, LoadOutcome::success(makeMessage("first", "x")));
    loader.forceComplete(0, LoadOutcome::success(makeMessage("second", "y")));
    queue.drain();

    EXPECT_EQ(coordinator.display().title, "first");
    EXPECT_EQ(coordinator.discardedDeliveries(), 1u);
}

TEST_F(SelectionLoadCoordinatorTest, FailureShowsBlankContentAndLogsEntry)
{
    coordinator.select(makeEntry("broken.eml", 1));
    loader.complete(0, LoadOutcome::failure(LoadError::Parse, "message has no headers"));
    queue.drain();

    const auto &display = coordinator.display();
    EXPECT_EQ(display.state, ViewState::Failed);
    EXPECT_EQ(display.title, spool::viewer::kNeutralTitle);
    EXPECT_TRUE(display.body.empty());
    EXPECT_TRUE(display.headers.empty());
    EXPECT_FALSE(display.bodyTabVisible);
    EXPECT_FALSE(display.textTabVisible);
    EXPECT_FALSE(display.forwardEnabled);
    EXPECT_TRUE(display.deleteEnabled);
    EXPECT_NE(display.failureReason.find("broken.eml"), std::string::npos);
    EXPECT_TRUE(log.contains(spool::log::Level::Warning, "broken.eml"));
    EXPECT_EQ(coordinator.activeSession(), nullptr);
}

TEST_F(SelectionLoadCoordinatorTest, ReselectionAfterFailureLoadsAgain)
{
    coordinator.select(makeEntry("a", 1));
    loader.complete(0, LoadOutcome::failure(LoadError::Io, "gone"));
    queue.drain();
    ASSERT_EQ(coordinator.state(), ViewState::Failed);

    coordinator.reload();
    ASSERT_EQ(loader.requests.size(), 2u);
    loader.complete(1, LoadOutcome::success(makeMessage("back", "ok")));
    queue.drain();
    EXPECT_EQ(coordinator.state(), ViewState::Rendered);
}

TEST_F(SelectionLoadCoordinatorTest, LoaderThrowingOnStartIsContained)
{
    loader.throwOnGet = true;
    EXPECT_NO_THROW(coordinator.select(makeEntry("a", 1)));
    EXPECT_EQ(coordinator.state(), ViewState::Failed);
}

TEST_F(SelectionLoadCoordinatorTest, ClearingSelectionResetsEverything)
{
    coordinator.select(makeEntry("a", 1));
    loader.complete(0, LoadOutcome::success(makeMessage("Hello", "body")));
    queue.drain();

    coordinator.select(std::nullopt);
    const auto &display = coordinator.display();
    EXPECT_EQ(display.state, ViewState::Idle);
    EXPECT_EQ(display.title, spool::viewer::kNeutralTitle);
    EXPECT_TRUE(display.subject.empty());
    EXPECT_FALSE(display.contentEnabled);
    EXPECT_FALSE(display.deleteEnabled);
    EXPECT_FALSE(display.forwardEnabled);
    EXPECT_EQ(coordinator.currentSession(), nullptr);
}

TEST_F(SelectionLoadCoordinatorTest, ClearingSelectionCancelsPendingLoad)
{
    coordinator.select(makeEntry("a", 1));
    coordinator.select(std::nullopt);
    EXPECT_TRUE(loader.cancelled(0));

    loader.forceComplete(0, LoadOutcome::success(makeMessage("late", "x")));
    queue.drain();
    EXPECT_EQ(coordinator.state(), ViewState::Idle);
    EXPECT_EQ(coordinator.discardedDeliveries(), 1u);
}

TEST_F(SelectionLoadCoordinatorTest, DestroyedCoordinatorIgnoresQueuedCompletion)
{
    ManualContentLoader localLoader;
    UiQueue localQueue;
    {
        SelectionLoadCoordinator local(localLoader, localQueue, nullptr, log.logger);
        local.select(makeEntry("a", 1));
        localLoader.forceComplete(0, LoadOutcome::success(makeMessage("x", "y")));
    }
    EXPECT_NO_THROW(localQueue.drain());
}

TEST(SelectionLoadCoordinator, HtmlBodyIsMaterializedWithTextTab)
{
    namespace fs = std::filesystem;
    const fs::path scratch = fs::temp_directory_path() /
                             ("spool-coordinator-" +
                              std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

    ManualContentLoader loader;
    UiQueue queue;
    spool::log::Logger logger;
    spool::viewer::RenderMaterializer materializer(scratch);
    SelectionLoadCoordinator coordinator(loader, queue, &materializer, logger);

    auto message = std::make_shared<spool::mail::FullMessage>(*makeMessage("Rich", "<p>hi</p>", "text/html"));
    message->plainText = spool::mail::TextPart{"text/plain", "hi"};

    coordinator.select(makeEntry("rich", 1));
    loader.complete(0, LoadOutcome::success(message));
    queue.drain();

    const auto &display = coordinator.display();
    EXPECT_TRUE(display.bodyIsHtml);
    EXPECT_TRUE(display.textTabVisible);
    EXPECT_EQ(display.plainText, "hi");
    ASSERT_FALSE(display.htmlFile.empty());
    EXPECT_TRUE(fs::exists(display.htmlFile));

    std::error_code ec;
    fs::remove_all(scratch, ec);
}

TEST(SelectionLoadCoordinator, ViewStateNames)
{
    EXPECT_STREQ(spool::viewer::viewStateName(ViewState::Idle), "idle");
    EXPECT_STREQ(spool::viewer::viewStateName(ViewState::Loading), "loading");
    EXPECT_STREQ(spool::viewer::viewStateName(ViewState::Rendered), "rendered");
    EXPECT_STREQ(spool::viewer::viewStateName(ViewState::Failed), "failed");
}
