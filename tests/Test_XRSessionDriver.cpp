#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <string>
#include <thread>

import XR;
import Core;

using namespace std::chrono_literals;

namespace
{
    constexpr std::array<XR::SessionState, 9> kAllStates{
        XR::SessionState::Unknown, XR::SessionState::Idle, XR::SessionState::Ready,
        XR::SessionState::Synchronized, XR::SessionState::Visible, XR::SessionState::Focused,
        XR::SessionState::Stopping, XR::SessionState::LossPending, XR::SessionState::Exiting};

    // Written out independently of ClassifyTransition.
    XR::SessionAction ExpectedAction(XR::SessionState previous, XR::SessionState current)
    {
        using S = XR::SessionState;
        using A = XR::SessionAction;
        if (previous == S::Stopping && current == S::Idle) return A::None;
        switch (current)
        {
            case S::Idle: return A::YieldIdle;
            case S::Ready: return previous == S::Idle ? A::BeginSession : A::None;
            case S::Exiting: return A::Shutdown;
            case S::Stopping: return A::EndSession;
            default: return A::None;
        }
    }

    XR::SimulatedRuntimeConfig ManualRuntime()
    {
        XR::SimulatedRuntimeConfig config;
        config.AutoAdvance = false;
        config.StartReady = false;
        return config;
    }

    XR::SessionDriverConfig ShortIdle()
    {
        XR::SessionDriverConfig config;
        config.IdleSleep = 1ms;
        return config;
    }
}

TEST(SessionDriver, ClassifyTransition_FirstMatchWins)
{
    using S = XR::SessionState;
    using A = XR::SessionAction;

    EXPECT_EQ(XR::ClassifyTransition(S::Stopping, S::Idle), A::None);
    EXPECT_EQ(XR::ClassifyTransition(S::Focused, S::Idle), A::YieldIdle);
    EXPECT_EQ(XR::ClassifyTransition(S::Idle, S::Idle), A::YieldIdle);
    EXPECT_EQ(XR::ClassifyTransition(S::Idle, S::Ready), A::BeginSession);
    EXPECT_EQ(XR::ClassifyTransition(S::Unknown, S::Ready), A::None);
    EXPECT_EQ(XR::ClassifyTransition(S::Stopping, S::Exiting), A::Shutdown);
    EXPECT_EQ(XR::ClassifyTransition(S::Focused, S::Stopping), A::EndSession);
    EXPECT_EQ(XR::ClassifyTransition(S::Visible, S::Focused), A::None);
    EXPECT_EQ(XR::ClassifyTransition(S::Focused, S::LossPending), A::None);
}

TEST(SessionDriver, EveryPairFiresItsActionOnce)
{
    for (XR::SessionState previous : kAllStates)
    {
        for (XR::SessionState current : kAllStates)
        {
            SCOPED_TRACE(std::string(XR::ToString(previous)) + " -> " + std::string(XR::ToString(current)));

            Core::QuitSignal quit;
            XR::SimulatedRuntime runtime(ManualRuntime());
            XR::SessionDriver driver(runtime, quit, ShortIdle());

            if (previous != XR::SessionState::Unknown)
            {
                runtime.QueueState(previous);
                ASSERT_TRUE(driver.Poll().has_value());
            }
            const uint32_t beginsBefore = runtime.GetBeginSessionCount();

            runtime.QueueState(current);
            auto transition = driver.Poll();
            ASSERT_TRUE(transition.has_value());

            EXPECT_EQ(transition->Previous, previous);
            EXPECT_EQ(transition->Current, current);
            EXPECT_EQ(transition->Action, ExpectedAction(previous, current));

            const bool begins = transition->Action == XR::SessionAction::BeginSession;
            EXPECT_EQ(runtime.GetBeginSessionCount(), beginsBefore + (begins ? 1u : 0u));
        }
    }
}

TEST(SessionDriver, AppliesOneStateChangePerPoll)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriver driver(runtime, quit, ShortIdle());

    runtime.QueueState(XR::SessionState::Idle);
    runtime.QueueState(XR::SessionState::Ready);
    runtime.QueueState(XR::SessionState::Synchronized);

    auto first = driver.Poll();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->Current, XR::SessionState::Idle);
    EXPECT_EQ(runtime.GetPendingEventCount(), 2u);

    auto second = driver.Poll();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->Previous, XR::SessionState::Idle);
    EXPECT_EQ(second->Current, XR::SessionState::Ready);
    EXPECT_EQ(second->Action, XR::SessionAction::BeginSession);

    auto third = driver.Poll();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->Previous, XR::SessionState::Ready);
    EXPECT_EQ(third->Current, XR::SessionState::Synchronized);
    EXPECT_EQ(third->Action, XR::SessionAction::None);
}

TEST(SessionDriver, BeginAndEndSessionRunOncePerTransition)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriver driver(runtime, quit, ShortIdle());

    runtime.QueueState(XR::SessionState::Idle);
    runtime.QueueState(XR::SessionState::Ready);
    ASSERT_TRUE(driver.Poll().has_value());
    ASSERT_TRUE(driver.Poll().has_value());
    EXPECT_TRUE(driver.IsSessionRunning());

    // No new events: Ready -> Ready must not begin again.
    auto idlePoll = driver.Poll();
    ASSERT_TRUE(idlePoll.has_value());
    EXPECT_EQ(idlePoll->Action, XR::SessionAction::None);
    EXPECT_EQ(runtime.GetBeginSessionCount(), 1u);

    runtime.QueueState(XR::SessionState::Stopping);
    auto stopping = driver.Poll();
    ASSERT_TRUE(stopping.has_value());
    EXPECT_EQ(stopping->Action, XR::SessionAction::EndSession);
    EXPECT_EQ(runtime.GetEndSessionCount(), 1u);
    EXPECT_FALSE(driver.IsSessionRunning());

    // Stopping persists without new events; the session is not ended twice.
    ASSERT_TRUE(driver.Poll().has_value());
    EXPECT_EQ(runtime.GetEndSessionCount(), 1u);
}

TEST(SessionDriver, QuitForcesShutdownInAnyState)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriver driver(runtime, quit, ShortIdle());

    runtime.QueueState(XR::SessionState::Focused);
    auto focused = driver.Poll();
    ASSERT_TRUE(focused.has_value());
    EXPECT_EQ(focused->Action, XR::SessionAction::None);

    quit.Request();
    auto shutdown = driver.Poll();
    ASSERT_TRUE(shutdown.has_value());
    EXPECT_EQ(shutdown->Current, XR::SessionState::Focused);
    EXPECT_EQ(shutdown->Action, XR::SessionAction::Shutdown);
}

TEST(SessionDriver, QuitDuringIdleSleepEndsWaitEarly)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriverConfig config;
    config.IdleSleep = 10s;
    XR::SessionDriver driver(runtime, quit, config);

    runtime.QueueState(XR::SessionState::Idle);

    std::thread requester([&]
    {
        std::this_thread::sleep_for(50ms);
        quit.Request();
    });

    const auto start = std::chrono::steady_clock::now();
    auto transition = driver.Poll();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    requester.join();

    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->Action, XR::SessionAction::Shutdown);
    EXPECT_LT(elapsed, 5s);
}

TEST(SessionDriver, IdleSleepIsBounded)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriverConfig config;
    config.IdleSleep = 20ms;
    XR::SessionDriver driver(runtime, quit, config);

    runtime.QueueState(XR::SessionState::Idle);

    const auto start = std::chrono::steady_clock::now();
    auto transition = driver.Poll();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->Action, XR::SessionAction::YieldIdle);
    EXPECT_GE(elapsed, 15ms);
    EXPECT_LT(elapsed, 5s);
}

TEST(SessionDriver, TeardownIsDistinctFromOtherFailures)
{
    Core::QuitSignal quit;

    {
        XR::SimulatedRuntime runtime(ManualRuntime());
        XR::SessionDriver driver(runtime, quit, ShortIdle());
        runtime.FailNextPoll(Core::ErrorCode::RuntimeTeardown);

        auto result = driver.Poll();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), Core::ErrorCode::RuntimeTeardown);
    }
    {
        XR::SimulatedRuntime runtime(ManualRuntime());
        XR::SessionDriver driver(runtime, quit, ShortIdle());
        runtime.FailNextPoll(Core::ErrorCode::RuntimeCallFailed);

        auto result = driver.Poll();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), Core::ErrorCode::RuntimeCallFailed);

        // Not a teardown: the runtime keeps working afterwards.
        EXPECT_TRUE(driver.Poll().has_value());
    }
}

TEST(SessionDriver, BeginSessionFailureIsReturned)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriver driver(runtime, quit, ShortIdle());

    // The runtime already runs a session, so the driver's begin is rejected.
    ASSERT_TRUE(runtime.BeginSession().has_value());

    runtime.QueueState(XR::SessionState::Idle);
    runtime.QueueState(XR::SessionState::Ready);
    ASSERT_TRUE(driver.Poll().has_value());

    auto result = driver.Poll();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
}

TEST(SessionDriver, NonStateEventsAreConsumed)
{
    Core::QuitSignal quit;
    XR::SimulatedRuntime runtime(ManualRuntime());
    XR::SessionDriver driver(runtime, quit, ShortIdle());

    XR::SessionEvent lost;
    lost.Type = XR::SessionEvent::Kind::EventsLost;
    lost.LostCount = 3;
    XR::SessionEvent profile;
    profile.Type = XR::SessionEvent::Kind::InteractionProfileChanged;

    runtime.QueueEvent(lost);
    runtime.QueueEvent(profile);
    runtime.QueueState(XR::SessionState::Ready);

    auto transition = driver.Poll();
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->Current, XR::SessionState::Ready);
    EXPECT_EQ(driver.GetLostEventCount(), 3u);
    EXPECT_EQ(runtime.GetPendingEventCount(), 0u);
}
