#include <gtest/gtest.h>
#include "commands/commands_core.hpp"
#include "test_fakes.hpp"

#include <stdexcept>

// ------------------------------------------------------------
// Plain function-pointer handlers recording their calls
// ------------------------------------------------------------
static std::vector<std::string> g_calls;

static CommandResult recordOk(CommandContext&, const std::string& arg) {
    g_calls.push_back(arg);
    CommandResult r;
    r.message = "done " + arg;
    r.success = true;
    r.errorCode = "ERR_NONE";
    return r;
}

static CommandResult recordThrow(CommandContext&, const std::string& arg) {
    g_calls.push_back(arg);
    throw std::runtime_error("boom");
}

static CommandResult recordThrowInt(CommandContext&, const std::string& arg) {
    g_calls.push_back(arg);
    throw 42;
}

static CommandResult recordSpoken(CommandContext&, const std::string& arg) {
    g_calls.push_back(arg);
    CommandResult r;
    r.message = "said " + arg;
    r.voice = "said " + arg;
    r.success = true;
    return r;
}

static CommandResult recordFail(CommandContext&, const std::string& arg) {
    g_calls.push_back(arg);
    CommandResult r;
    r.message = "nope";
    r.success = false;
    return r;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override { g_calls.clear(); }

    static std::vector<DispatchResult> drain(ActionDispatcher::BatchRun batch) {
        std::vector<DispatchResult> out;
        while (auto r = batch.next()) out.push_back(*r);
        return out;
    }
};

TEST_F(DispatcherTest, ThrowingSegmentDoesNotStopTheBatch) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordOk);
    d.registerHandler(IntentTag::Close, recordThrow);

    IntentSegments segs{ {IntentTag::Open, "a"}, {IntentTag::Close, "b"}, {IntentTag::Open, "c"} };
    auto results = drain(d.runBatch(segs, "open a close b open c"));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].outcome, DispatchOutcome::Success);
    EXPECT_EQ(results[1].outcome, DispatchOutcome::Failure);
    EXPECT_EQ(results[1].errorCode, "ERR_HANDLER_EXCEPTION");
    EXPECT_EQ(results[2].outcome, DispatchOutcome::Success);
    EXPECT_EQ(results[2].text, "done c");
    EXPECT_EQ(g_calls, (std::vector<std::string>{ "a", "b", "c" }));
}

TEST_F(DispatcherTest, NonStandardThrowBecomesFailure) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordOk);
    d.registerHandler(IntentTag::Close, recordThrowInt);

    IntentSegments segs{ {IntentTag::Close, "a"}, {IntentTag::Open, "b"} };
    auto results = drain(d.runBatch(segs, "close a open b"));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].outcome, DispatchOutcome::Failure);
    EXPECT_EQ(results[0].errorCode, "ERR_HANDLER_EXCEPTION");
    EXPECT_EQ(results[1].outcome, DispatchOutcome::Success);
    EXPECT_EQ(g_calls, (std::vector<std::string>{ "a", "b" }));
}

TEST_F(DispatcherTest, SpeechHandOffErrorKeepsSuccess) {
    FakeSpeech speech;
    speech.failing = true;
    Capabilities caps;
    caps.speech = &speech;

    ActionDispatcher d(caps);
    d.registerHandler(IntentTag::Open, recordSpoken);

    auto r = d.dispatch({IntentTag::Open, "x"}, "open x");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(r.text, "said x");
    EXPECT_TRUE(speech.spoken.empty());
}

TEST_F(DispatcherTest, FailedResultWithoutCodeGetsOne) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordFail);

    auto r = d.dispatch({IntentTag::Open, "x"}, "open x");
    EXPECT_EQ(r.outcome, DispatchOutcome::Failure);
    EXPECT_FALSE(r.errorCode.empty());
}

TEST_F(DispatcherTest, ExitHaltsWithoutSideEffects) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordOk);
    d.registerHandler(IntentTag::General, recordOk);

    auto batch = d.runBatch({ {IntentTag::Exit, ""}, {IntentTag::Open, "x"} }, "exit");
    auto first = batch.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->outcome, DispatchOutcome::Halt);
    EXPECT_TRUE(batch.halted());
    EXPECT_TRUE(batch.done());
    EXPECT_FALSE(batch.next().has_value());
    EXPECT_TRUE(g_calls.empty());
}

TEST_F(DispatcherTest, HaltInTheMiddleStopsLaterSegments) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordOk);

    auto results = drain(d.runBatch(
        { {IntentTag::Open, "a"}, {IntentTag::Exit, ""}, {IntentTag::Open, "b"} }, "u"));
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].outcome, DispatchOutcome::Halt);
    EXPECT_EQ(g_calls, (std::vector<std::string>{ "a" }));
}

TEST_F(DispatcherTest, UnknownTagFallsBackToGeneralWithUtterance) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::General, recordOk);

    auto r = d.dispatch({IntentTag::Unknown, "fragment"}, "the whole utterance");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(g_calls, (std::vector<std::string>{ "the whole utterance" }));
}

TEST_F(DispatcherTest, UnregisteredTagFallsBackToGeneral) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::General, recordOk);

    auto r = d.dispatch({IntentTag::Reminder, "call mom"}, "remind me to call mom");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(g_calls, (std::vector<std::string>{ "remind me to call mom" }));
}

TEST_F(DispatcherTest, NoHandlersAtAllIsAFailureNotACrash) {
    ActionDispatcher d(Capabilities{});
    auto r = d.dispatch({IntentTag::General, "hi"}, "hi");
    EXPECT_EQ(r.outcome, DispatchOutcome::Failure);
    EXPECT_EQ(r.errorCode, "ERR_CAPABILITY_MISSING");
}

TEST_F(DispatcherTest, BatchIsSinglePass) {
    ActionDispatcher d(Capabilities{});
    d.registerHandler(IntentTag::Open, recordOk);

    auto batch = d.runBatch({ {IntentTag::Open, "a"} }, "open a");
    EXPECT_TRUE(batch.next().has_value());
    EXPECT_FALSE(batch.next().has_value());
    EXPECT_EQ(batch.position(), 1u);
    EXPECT_EQ(g_calls.size(), 1u);
}

// ------------------------------------------------------------
// Default command table against fake capabilities
// ------------------------------------------------------------
class DefaultCommandsTest : public ::testing::Test {
protected:
    FakeChat chat{ "hi there" };
    FakeChat realtime{ "it is sunny" };
    FakeSystem system;
    FakeReminders reminders;
    FakeSpeech speech;

    Capabilities caps() {
        Capabilities c;
        c.chat = &chat;
        c.realtime = &realtime;
        c.system = &system;
        c.reminders = &reminders;
        c.speech = &speech;
        return c;
    }
};

TEST_F(DefaultCommandsTest, GeneralReplyIsSpoken) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto r = d.dispatch({IntentTag::General, "hello"}, "hello");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(r.text, "hi there");
    EXPECT_EQ(chat.queries, (std::vector<std::string>{ "hello" }));
    EXPECT_EQ(speech.spoken, (std::vector<std::string>{ "hi there" }));
}

TEST_F(DefaultCommandsTest, RealtimeUsesTheWebService) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto r = d.dispatch({IntentTag::Realtime, "weather today"}, "weather today");
    EXPECT_EQ(r.text, "it is sunny");
    EXPECT_TRUE(chat.queries.empty());
    EXPECT_EQ(realtime.queries.size(), 1u);
}

TEST_F(DefaultCommandsTest, BackendFailureIsASilentFailure) {
    chat.fail = true;
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto results = std::vector<DispatchResult>{};
    auto batch = d.runBatch({ {IntentTag::General, "a"}, {IntentTag::Open, "firefox"} }, "a");
    while (auto r = batch.next()) results.push_back(*r);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].outcome, DispatchOutcome::Failure);
    EXPECT_EQ(results[0].errorCode, "ERR_CHAT_BACKEND_FAILED");
    EXPECT_EQ(results[1].outcome, DispatchOutcome::Success);
    EXPECT_EQ(system.opened, (std::vector<std::string>{ "firefox" }));
    EXPECT_TRUE(speech.spoken.empty());
}

TEST_F(DefaultCommandsTest, MissingCapabilityFails) {
    Capabilities c;   // nothing injected
    ActionDispatcher d(c);
    registerDefaultCommands(d);

    EXPECT_EQ(d.dispatch({IntentTag::General, "x"}, "x").errorCode, "ERR_CAPABILITY_MISSING");
    EXPECT_EQ(d.dispatch({IntentTag::Open, "x"}, "x").errorCode, "ERR_CAPABILITY_MISSING");
    EXPECT_EQ(d.dispatch({IntentTag::Reminder, "x"}, "x").errorCode, "ERR_CAPABILITY_MISSING");
}

TEST_F(DefaultCommandsTest, SearchesOpenUrls) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    d.dispatch({IntentTag::GoogleSearch, "who won"}, "google who won");
    d.dispatch({IntentTag::YouTubeSearch, "lofi beats"}, "youtube lofi beats");
    d.dispatch({IntentTag::Play, "despacito"}, "play despacito");
    d.dispatch({IntentTag::YouTubeSearch, ""}, "youtube");

    ASSERT_EQ(system.urls.size(), 4u);
    EXPECT_EQ(system.urls[0], "https://www.google.com/search?q=who%20won");
    EXPECT_EQ(system.urls[1], "https://www.youtube.com/results?search_query=lofi+beats");
    EXPECT_EQ(system.urls[2], "https://www.youtube.com/results?search_query=despacito");
    EXPECT_EQ(system.urls[3], "https://www.youtube.com/");
}

TEST_F(DefaultCommandsTest, OpenCloseNeedATarget) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    EXPECT_EQ(d.dispatch({IntentTag::Open, "  "}, "open").errorCode, "ERR_APP_NO_ARGUMENT");
    EXPECT_EQ(d.dispatch({IntentTag::Close, ""}, "close").errorCode, "ERR_APP_NO_ARGUMENT");
    EXPECT_TRUE(system.opened.empty());

    EXPECT_EQ(d.dispatch({IntentTag::Close, "spotify"}, "close spotify").outcome, DispatchOutcome::Success);
    EXPECT_EQ(system.closed, (std::vector<std::string>{ "spotify" }));
}

TEST_F(DefaultCommandsTest, OsActionThatCannotStartFails) {
    system.ok = false;
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    EXPECT_EQ(d.dispatch({IntentTag::Open, "x"}, "open x").errorCode, "ERR_APP_LAUNCH_FAILED");
    EXPECT_EQ(d.dispatch({IntentTag::GoogleSearch, "x"}, "google x").errorCode, "ERR_WEB_OPEN_FAILED");
    EXPECT_EQ(d.dispatch({IntentTag::System, "mute"}, "system mute").errorCode, "ERR_SYSTEM_COMMAND_FAILED");
}

TEST_F(DefaultCommandsTest, SystemCommandConfirmationIsSpoken) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto r = d.dispatch({IntentTag::System, "mute"}, "system mute");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(system.commands, (std::vector<std::string>{ "mute" }));
    EXPECT_EQ(speech.spoken, (std::vector<std::string>{ "Executing system command: mute" }));
}

TEST_F(DefaultCommandsTest, ReminderIsStoredAndConfirmed) {
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto r = d.dispatch({IntentTag::Reminder, "5pm call mom"}, "remind me at 5pm call mom");
    EXPECT_EQ(r.outcome, DispatchOutcome::Success);
    EXPECT_EQ(reminders.lines, (std::vector<std::string>{ "5pm call mom" }));
    EXPECT_EQ(speech.spoken, (std::vector<std::string>{ "Reminder saved." }));
}

TEST_F(DefaultCommandsTest, ReminderWriteFailure) {
    reminders.fail = true;
    ActionDispatcher d(caps());
    registerDefaultCommands(d);

    auto r = d.dispatch({IntentTag::Reminder, "x"}, "remind me x");
    EXPECT_EQ(r.outcome, DispatchOutcome::Failure);
    EXPECT_EQ(r.errorCode, "ERR_REMINDER_WRITE_FAILED");
    EXPECT_TRUE(speech.spoken.empty());
}
