//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Bootsteps/Framework/Config/DefaultSocketTimeout.hpp>
#include <Bootsteps/Framework/Exception/InvalidNamespaceStateException.hpp>
#include <Bootsteps/Framework/Exception/ShutdownAggregateException.hpp>
#include <Bootsteps/Framework/Host/ComponentHost.hpp>
#include <Bootsteps/Framework/Lifecycle/Namespace.hpp>
#include <Bootsteps/TestComponents.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace Bootsteps
{
  using namespace std::chrono_literals;

  namespace
  {
    using Names = std::vector<std::string>;

    // ============================================================================
    // Fixture: a namespace with its own registry, host and call tracker
    // ============================================================================

    class NamespaceLifecycleTest : public ::testing::Test
    {
    protected:
      TestSupport::CallTracker Tracker;
      ComponentRegistry Registry;
      ComponentHost Host;
      TestSupport::SocketTimeoutRestorer TimeoutRestorer;

      void Add(const std::string& name, std::vector<std::string> dependencies = {}, TestSupport::RecordingBehavior behavior = {})
      {
        Registry.Register(TestSupport::MakeRecordingBlueprint("boot." + name, std::move(dependencies), Tracker, std::move(behavior)));
      }

      void AddLast(const std::string& name, TestSupport::RecordingBehavior behavior = {})
      {
        Registry.Register(TestSupport::MakeLastBlueprint("boot." + name, Tracker, std::move(behavior)));
      }

      std::unique_ptr<Namespace> Build(NamespaceConfig config = {}, NamespaceHooks hooks = {})
      {
        auto ns = std::make_unique<Namespace>("boot", std::move(hooks), config, Registry);
        ns->Apply(Host);
        return ns;
      }

      // The documented example: a, b requires a, c is last
      void AddExample(TestSupport::RecordingBehavior cBehavior = {})
      {
        Add("a");
        Add("b", {"a"});
        AddLast("c", std::move(cBehavior));
      }
    };
  }

  TEST_F(NamespaceLifecycleTest, Start_StartsInBootOrder)
  {
    AddExample();
    auto ns = Build();

    ns->Start(Host);

    EXPECT_EQ(ns->GetState(), NamespaceState::Run);
    EXPECT_EQ(ns->GetStartedCount(), 3u);
    EXPECT_EQ(Tracker.GetNames("start"), (Names{"a", "b", "c"}));
    EXPECT_FALSE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Stop_ClosesThenStopsInReverseOrder)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);
    Tracker.Clear();

    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetCalls(), (Names{"close:a", "close:b", "close:c", "stop:c", "stop:b", "stop:a"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
    EXPECT_TRUE(ns->Join(0ms));
  }

  TEST_F(NamespaceLifecycleTest, Terminate_TerminatesInReverseOrder)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);
    Tracker.Clear();

    ns->Terminate(Host);

    EXPECT_EQ(Tracker.GetNames("terminate"), (Names{"c", "b", "a"}));
    EXPECT_TRUE(Tracker.GetNames("stop").empty());
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Start_FailureAtThirdOfFive_StopOnlyCloses)
  {
    Add("c1");
    Add("c2");
    TestSupport::RecordingBehavior failing;
    failing.FailStart = true;
    Add("c3", {}, failing);
    Add("c4");
    Add("c5");
    auto ns = Build();

    EXPECT_THROW(ns->Start(Host), std::runtime_error);
    EXPECT_EQ(ns->GetStartedCount(), 3u);
    EXPECT_EQ(ns->GetState(), NamespaceState::Run);
    EXPECT_EQ(Tracker.GetNames("start"), (Names{"c1", "c2", "c3"}));

    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetNames("close"), (Names{"c1", "c2", "c3", "c4", "c5"}));
    EXPECT_TRUE(Tracker.GetNames("stop").empty());
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Start_FailureOfLastComponent_CountsAsFullyStarted)
  {
    TestSupport::RecordingBehavior failing;
    failing.FailStart = true;
    AddExample(failing);
    auto ns = Build();

    EXPECT_THROW(ns->Start(Host), std::runtime_error);
    EXPECT_EQ(ns->GetStartedCount(), 3u);

    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetNames("stop"), (Names{"c", "b", "a"}));
  }

  TEST_F(NamespaceLifecycleTest, Stop_BeforeStart_OnlyCloses)
  {
    AddExample();
    auto ns = Build();

    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetNames("close"), (Names{"a", "b", "c"}));
    EXPECT_TRUE(Tracker.GetNames("stop").empty());
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Stop_Twice_SecondCallIsNoOp)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);
    ns->Stop(Host);
    Tracker.Clear();

    ns->Stop(Host);
    ns->Terminate(Host);

    EXPECT_TRUE(Tracker.GetCalls().empty());
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
  }

  TEST_F(NamespaceLifecycleTest, Stop_FromInsideComponentStop_ReturnsImmediately)
  {
    Namespace* target = nullptr;
    TestSupport::RecordingBehavior reentrant;
    reentrant.OnStop = [&target, this]() { target->Stop(Host); };
    Add("a");
    AddLast("b", reentrant);
    auto ns = Build();
    target = ns.get();
    ns->Start(Host);

    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetNames("stop"), (Names{"b", "a"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
  }

  TEST_F(NamespaceLifecycleTest, Stop_ConcurrentCaller_ReturnsWhileFirstIsStopping)
  {
    std::promise<void> stopEntered;
    std::promise<void> releaseStop;
    auto released = releaseStop.get_future().share();
    TestSupport::RecordingBehavior blocking;
    blocking.OnStop = [&stopEntered, released]()
    {
      stopEntered.set_value();
      released.wait();
    };
    Add("a");
    AddLast("b", blocking);
    auto ns = Build();
    ns->Start(Host);

    std::thread first([&ns, this]() { ns->Stop(Host); });
    stopEntered.get_future().wait();

    ns->Stop(Host);
    EXPECT_EQ(ns->GetState(), NamespaceState::Close);

    releaseStop.set_value();
    first.join();

    EXPECT_EQ(Tracker.GetNames("stop"), (Names{"b", "a"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
  }

  TEST_F(NamespaceLifecycleTest, Start_Twice_Throws)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);

    EXPECT_THROW(ns->Start(Host), InvalidNamespaceStateException);
    EXPECT_EQ(Tracker.GetNames("start").size(), 3u);
  }

  TEST_F(NamespaceLifecycleTest, Start_AfterStop_Throws)
  {
    AddExample();
    auto ns = Build();
    ns->Stop(Host);

    EXPECT_THROW(ns->Start(Host), InvalidNamespaceStateException);
  }

  TEST_F(NamespaceLifecycleTest, Start_SkipsNullEntries)
  {
    Add("a");
    auto ns = Build();
    Host.GetComponents().push_back(nullptr);

    ns->Start(Host);
    EXPECT_EQ(ns->GetStartedCount(), 1u);

    ns->Stop(Host);

    // The trailing null entry leaves the started count short of the list size
    EXPECT_TRUE(Tracker.GetNames("stop").empty());
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
  }

  TEST_F(NamespaceLifecycleTest, Hooks_RunAtLifecyclePoints)
  {
    Add("a");
    NamespaceHooks hooks;
    hooks.OnStart = [this]() { Tracker.Record("hook", "start"); };
    hooks.OnClose = [this]() { Tracker.Record("hook", "close"); };
    hooks.OnStopped = [this]() { Tracker.Record("hook", "stopped"); };
    auto ns = Build({}, std::move(hooks));

    ns->Start(Host);
    ns->Stop(Host);

    EXPECT_EQ(Tracker.GetCalls(), (Names{"create:a", "hook:start", "start:a", "hook:close", "close:a", "stop:a", "hook:stopped"}));
  }

  TEST_F(NamespaceLifecycleTest, Stop_OverridesSocketTimeoutAndRestores)
  {
    DefaultSocketTimeout::Set(std::nullopt);
    std::optional<std::chrono::milliseconds> seenDuringStop;
    TestSupport::RecordingBehavior observing;
    observing.OnStop = [&seenDuringStop]() { seenDuringStop = DefaultSocketTimeout::Get(); };
    Add("a", {}, observing);
    NamespaceConfig config;
    config.ShutdownSocketTimeout = 250ms;
    auto ns = Build(config);
    ns->Start(Host);

    ns->Stop(Host);

    EXPECT_EQ(seenDuringStop, std::optional<std::chrono::milliseconds>(250ms));
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST_F(NamespaceLifecycleTest, Stop_DefaultConfig_UsesFiveSecondTimeout)
  {
    DefaultSocketTimeout::Set(1ms);
    std::optional<std::chrono::milliseconds> seenDuringStop;
    TestSupport::RecordingBehavior observing;
    observing.OnStop = [&seenDuringStop]() { seenDuringStop = DefaultSocketTimeout::Get(); };
    Add("a", {}, observing);
    auto ns = Build();
    ns->Start(Host);

    ns->Stop(Host);

    EXPECT_EQ(seenDuringStop, std::optional<std::chrono::milliseconds>(5000ms));
    EXPECT_EQ(DefaultSocketTimeout::Get(), std::optional<std::chrono::milliseconds>(1ms));
  }

  TEST_F(NamespaceLifecycleTest, Stop_PropagatePolicy_FirstFailureEscapes)
  {
    DefaultSocketTimeout::Set(std::nullopt);
    TestSupport::RecordingBehavior failing;
    failing.FailStop = true;
    Add("a");
    Add("b", {}, failing);
    AddLast("c");
    auto ns = Build();
    ns->Start(Host);

    EXPECT_THROW(ns->Stop(Host), std::runtime_error);

    EXPECT_EQ(Tracker.GetNames("stop"), (Names{"c", "b"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Close);
    EXPECT_FALSE(ns->GetShutdownSignal().IsSet());
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST_F(NamespaceLifecycleTest, Stop_PropagatePolicy_FailedShutdownNeverSignals)
  {
    TestSupport::RecordingBehavior failing;
    failing.FailStop = true;
    Add("a", {}, failing);
    auto ns = Build();
    ns->Start(Host);

    EXPECT_THROW(ns->Stop(Host), std::runtime_error);

    // The state is Close, so a retry does nothing and a join only returns through its timeout
    EXPECT_NO_THROW(ns->Stop(Host));
    EXPECT_EQ(Tracker.GetNames("stop"), Names{"a"});
    EXPECT_FALSE(ns->Join(10ms));
  }

  TEST_F(NamespaceLifecycleTest, Stop_ContinuePolicy_CollectsEveryFailure)
  {
    TestSupport::RecordingBehavior failingClose;
    failingClose.FailClose = true;
    TestSupport::RecordingBehavior failingStop;
    failingStop.FailStop = true;
    Add("a", {}, failingClose);
    Add("b");
    AddLast("c", failingStop);
    NamespaceConfig config;
    config.ErrorPolicy = ShutdownErrorPolicy::Continue;
    auto ns = Build(config);
    ns->Start(Host);

    try
    {
      ns->Stop(Host);
      FAIL() << "Expected ShutdownAggregateException";
    }
    catch (const ShutdownAggregateException& ex)
    {
      ASSERT_EQ(ex.FailureCount(), 2u);
      EXPECT_EQ(ex.GetFailures()[0].ComponentName, "boot.a");
      EXPECT_EQ(ex.GetFailures()[1].ComponentName, "boot.c");
    }

    EXPECT_EQ(Tracker.GetNames("stop"), (Names{"c", "b", "a"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Terminate);
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Stop_ContinuePolicy_CollectsHookFailure)
  {
    Add("a");
    NamespaceConfig config;
    config.ErrorPolicy = ShutdownErrorPolicy::Continue;
    NamespaceHooks hooks;
    hooks.OnStopped = []() { throw std::runtime_error("hook failed"); };
    auto ns = Build(config, std::move(hooks));
    ns->Start(Host);

    try
    {
      ns->Stop(Host);
      FAIL() << "Expected ShutdownAggregateException";
    }
    catch (const ShutdownAggregateException& ex)
    {
      ASSERT_EQ(ex.FailureCount(), 1u);
      EXPECT_EQ(ex.GetFailures()[0].ComponentName, "OnStopped");
    }
    EXPECT_TRUE(ns->GetShutdownSignal().IsSet());
  }

  TEST_F(NamespaceLifecycleTest, Close_CallsEveryComponent)
  {
    AddExample();
    auto ns = Build();

    ns->Close(Host);

    EXPECT_EQ(Tracker.GetNames("close"), (Names{"a", "b", "c"}));
    EXPECT_EQ(ns->GetState(), NamespaceState::Unset);
  }

  TEST_F(NamespaceLifecycleTest, Close_ContinuePolicy_ThrowsAfterClosingAll)
  {
    TestSupport::RecordingBehavior failing;
    failing.FailClose = true;
    Add("a", {}, failing);
    Add("b");
    NamespaceConfig config;
    config.ErrorPolicy = ShutdownErrorPolicy::Continue;
    auto ns = Build(config);

    EXPECT_THROW(ns->Close(Host), ShutdownAggregateException);
    EXPECT_EQ(Tracker.GetNames("close"), (Names{"a", "b"}));
  }

  TEST_F(NamespaceLifecycleTest, Join_Timeout_ReturnsFalse)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);

    EXPECT_FALSE(ns->Join(10ms));
  }

  TEST_F(NamespaceLifecycleTest, Join_ManyThreads_AllReleasedByStop)
  {
    AddExample();
    auto ns = Build();
    ns->Start(Host);

    std::atomic<int> released{0};
    std::vector<std::thread> joiners;
    for (int i = 0; i < 4; ++i)
    {
      joiners.emplace_back(
        [&ns, &released]()
        {
          if (ns->Join())
          {
            ++released;
          }
        });
    }

    ns->Stop(Host);
    for (auto& joiner : joiners)
    {
      joiner.join();
    }

    EXPECT_EQ(released.load(), 4);
  }
}
