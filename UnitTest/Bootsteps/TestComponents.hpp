#ifndef BOOTSTEPS_UNITTEST_TESTCOMPONENTS_HPP
#define BOOTSTEPS_UNITTEST_TESTCOMPONENTS_HPP
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

#include <Bootsteps/Framework/Component/Component.hpp>
#include <Bootsteps/Framework/Component/ComponentBlueprint.hpp>
#include <Bootsteps/Framework/Component/StartStopComponent.hpp>
#include <Bootsteps/Framework/Config/DefaultSocketTimeout.hpp>
#include <Bootsteps/Framework/Host/ComponentHost.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Bootsteps::TestSupport
{
  // ============================================================================
  // Shared call tracker
  // ============================================================================

  /// Records lifecycle calls as "action:name", for example "start:timer".
  class CallTracker
  {
    mutable std::mutex m_mutex;
    std::vector<std::string> m_calls;

  public:
    void Record(const std::string& action, const std::string& name)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_calls.push_back(action + ":" + name);
    }

    std::vector<std::string> GetCalls() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_calls;
    }

    /// Names recorded for one action, in call order.
    std::vector<std::string> GetNames(const std::string& action) const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      std::vector<std::string> result;
      const std::string prefix = action + ":";
      for (const auto& call : m_calls)
      {
        if (call.compare(0, prefix.size(), prefix) == 0)
        {
          result.push_back(call.substr(prefix.size()));
        }
      }
      return result;
    }

    void Clear()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_calls.clear();
    }
  };

  // ============================================================================
  // Recording service and components
  // ============================================================================

  struct RecordingBehavior
  {
    bool FailStart{false};
    bool FailStop{false};
    bool FailClose{false};
    bool FailTerminate{false};
    bool Included{true};
    /// Called from the service Stop, lets a test observe state during shutdown.
    std::function<void()> OnStop;
  };

  class RecordingService final : public IStartStopService
  {
    std::string m_name;
    CallTracker& m_tracker;
    RecordingBehavior m_behavior;

  public:
    RecordingService(std::string name, CallTracker& tracker, RecordingBehavior behavior)
      : m_name(std::move(name))
      , m_tracker(tracker)
      , m_behavior(std::move(behavior))
    {
    }

    void Start() override
    {
      m_tracker.Record("start", m_name);
      if (m_behavior.FailStart)
      {
        throw std::runtime_error("start failed: " + m_name);
      }
    }

    void Stop() override
    {
      m_tracker.Record("stop", m_name);
      if (m_behavior.OnStop)
      {
        m_behavior.OnStop();
      }
      if (m_behavior.FailStop)
      {
        throw std::runtime_error("stop failed: " + m_name);
      }
    }
  };

  class RecordingComponent final : public StartStopComponent
  {
    CallTracker& m_tracker;
    RecordingBehavior m_behavior;

  public:
    RecordingComponent(CallTracker& tracker, RecordingBehavior behavior)
      : m_tracker(tracker)
      , m_behavior(std::move(behavior))
    {
    }

    bool IncludeIf(IComponentHost& parent) override
    {
      return m_behavior.Included && StartStopComponent::IncludeIf(parent);
    }

    std::shared_ptr<IService> Create(IComponentHost& /*parent*/) override
    {
      m_tracker.Record("create", GetName());
      return std::make_shared<RecordingService>(GetName(), m_tracker, m_behavior);
    }

    void Close(IComponentHost& /*parent*/) override
    {
      m_tracker.Record("close", GetName());
      if (m_behavior.FailClose)
      {
        throw std::runtime_error("close failed: " + GetName());
      }
    }

    void Terminate(IComponentHost& /*parent*/) override
    {
      m_tracker.Record("terminate", GetName());
      if (m_behavior.FailTerminate)
      {
        throw std::runtime_error("terminate failed: " + GetName());
      }
    }
  };

  /// A component that only binds to the host and never takes part in start/stop.
  class PlainComponent final : public Component
  {
  public:
    explicit PlainComponent(CallTracker& tracker)
    {
      tracker.Record("bind", "plain");
    }
  };

  // ============================================================================
  // Blueprint helpers
  // ============================================================================

  inline ComponentBlueprint MakeRecordingBlueprint(const std::string& name, std::vector<std::string> dependencies, CallTracker& tracker,
                                                   RecordingBehavior behavior = {})
  {
    ComponentBlueprint blueprint;
    blueprint.Name = name;
    blueprint.Requires = std::move(dependencies);
    blueprint.Factory = [&tracker, behavior](IComponentHost& /*parent*/, const ComponentOptions& /*options*/) -> std::shared_ptr<Component>
    { return std::make_shared<RecordingComponent>(tracker, behavior); };
    return blueprint;
  }

  inline ComponentBlueprint MakeLastBlueprint(const std::string& name, CallTracker& tracker, RecordingBehavior behavior = {})
  {
    auto blueprint = MakeRecordingBlueprint(name, {}, tracker, std::move(behavior));
    blueprint.Last = true;
    return blueprint;
  }

  inline ComponentBlueprint MakePlainBlueprint(const std::string& name, std::vector<std::string> dependencies, CallTracker& tracker)
  {
    ComponentBlueprint blueprint;
    blueprint.Name = name;
    blueprint.Requires = std::move(dependencies);
    blueprint.Factory = [&tracker](IComponentHost& /*parent*/, const ComponentOptions& /*options*/) -> std::shared_ptr<Component>
    { return std::make_shared<PlainComponent>(tracker); };
    return blueprint;
  }

  /// Restores the process wide socket timeout after a test changed it.
  class SocketTimeoutRestorer
  {
    std::optional<std::chrono::milliseconds> m_saved{DefaultSocketTimeout::Get()};

  public:
    ~SocketTimeoutRestorer()
    {
      DefaultSocketTimeout::Set(m_saved);
    }
  };
}

#endif
