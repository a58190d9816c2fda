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
#include <Bootsteps/Framework/Component/StartStopComponent.hpp>
#include <Bootsteps/Framework/Config/DefaultSocketTimeout.hpp>
#include <Bootsteps/Framework/Exception/ComponentDefinitionException.hpp>
#include <Bootsteps/Framework/Exception/ComponentResolutionException.hpp>
#include <Bootsteps/Framework/Exception/InvalidNamespaceStateException.hpp>
#include <Bootsteps/Framework/Exception/UnknownComponentDependencyException.hpp>
#include <Bootsteps/Framework/Graph/DependencyGraph.hpp>
#include <Bootsteps/Framework/Host/IComponentHost.hpp>
#include <Bootsteps/Framework/Lifecycle/Namespace.hpp>
#include <Bootsteps/Framework/Log/Log.hpp>
#include <Bootsteps/Framework/Module/ModuleLoader.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace Bootsteps
{
  namespace
  {
    std::string Capitalize(const std::string& name)
    {
      std::string result(name);
      if (!result.empty())
      {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
      }
      return result;
    }

    std::string ValidateName(std::string name)
    {
      if (name.empty())
      {
        throw std::invalid_argument("Namespace name can not be empty");
      }
      return name;
    }

    // Clears the stop guard on every exit path of Stop
    class StopGuardReset
    {
      std::atomic<bool>& m_flag;

    public:
      explicit StopGuardReset(std::atomic<bool>& flag) noexcept
        : m_flag(flag)
      {
      }
      ~StopGuardReset()
      {
        m_flag.store(false);
      }

      StopGuardReset(const StopGuardReset&) = delete;
      StopGuardReset& operator=(const StopGuardReset&) = delete;
    };
  }

  Namespace::Namespace(std::string name, NamespaceHooks hooks, NamespaceConfig config, ComponentRegistry& registry)
    : m_name(ValidateName(std::move(name)))
    , m_displayName(Capitalize(m_name))
    , m_hooks(std::move(hooks))
    , m_config(std::move(config))
    , m_registry(registry)
  {
  }

  Namespace::~Namespace() = default;

  std::vector<std::string> Namespace::Modules() const
  {
    return {};
  }

  void Namespace::LoadModules()
  {
    for (const auto& module : Modules())
    {
      ImportModule(module);
    }
  }

  void Namespace::ImportModule(const std::string& module)
  {
    ModuleLoader::GetGlobal().Import(module);
  }

  void Namespace::Apply(IComponentHost& parent, const ComponentOptions& options)
  {
    if (m_applied.exchange(true))
    {
      Log::GetLogger()->error("Namespace::Apply: namespace '{}' was already applied", m_name);
      throw InvalidNamespaceStateException(fmt::format("Namespace '{}' was already applied", m_name));
    }

    Debug("Loading modules.");
    LoadModules();

    Debug("Claiming components.");
    m_blueprints = m_registry.Claim(m_name);

    Debug("Building boot step graph.");
    m_bootOrder = ResolveBootOrder();

    m_bootSteps.reserve(m_bootOrder.size());
    for (const auto& name : m_bootOrder)
    {
      m_bootSteps.push_back(BindComponent(GetBlueprint(name), parent, options));
    }
    if (Log::GetLogger()->should_log(spdlog::level::debug))
    {
      Debug(fmt::format("New boot order: {{{}}}", fmt::join(m_bootOrder, ", ")));
    }

    for (const auto& component : m_bootSteps)
    {
      component->Include(parent);
    }
  }

  void Namespace::Start(IComponentHost& parent)
  {
    NamespaceState expected = NamespaceState::Unset;
    if (!m_state.compare_exchange_strong(expected, NamespaceState::Run))
    {
      Log::GetLogger()->error("Namespace::Start: namespace '{}' can not start in state {}", m_name, ToString(expected));
      throw InvalidNamespaceStateException(fmt::format("Namespace '{}' can not start in state {}", m_name, ToString(expected)));
    }

    if (m_hooks.OnStart)
    {
      m_hooks.OnStart();
    }

    auto logger = Log::GetLogger();
    auto& components = parent.GetComponents();
    for (std::size_t i = 0; i < components.size(); ++i)
    {
      const auto& component = components[i];
      if (component)
      {
        logger->debug("Starting {}...", component->GetQualifiedName());
        m_started.store(i + 1);
        component->Start(parent);
        logger->debug("{} OK!", component->GetQualifiedName());
      }
    }
  }

  void Namespace::Close(IComponentHost& parent)
  {
    const bool collect = m_config.ErrorPolicy == ShutdownErrorPolicy::Continue;
    std::vector<ComponentFailure> failures;
    CloseComponents(parent, collect ? &failures : nullptr);
    ThrowIfFailed(std::move(failures), "closing");
  }

  void Namespace::Stop(IComponentHost& parent, const bool terminate)
  {
    bool expected = false;
    if (!m_stopInProgress.compare_exchange_strong(expected, true))
    {
      return;
    }
    StopGuardReset guardReset(m_stopInProgress);

    const NamespaceState state = m_state.load();
    if (state == NamespaceState::Close || state == NamespaceState::Terminate)
    {
      return;
    }

    ScopedSocketTimeout socketTimeout(m_config.ShutdownSocketTimeout);

    const bool collect = m_config.ErrorPolicy == ShutdownErrorPolicy::Continue;
    std::vector<ComponentFailure> failures;
    auto* failureSink = collect ? &failures : nullptr;

    CloseComponents(parent, failureSink);

    auto& components = parent.GetComponents();
    if (m_state.load() != NamespaceState::Run || m_started.load() != components.size())
    {
      // Not fully started, nothing to stop
      m_state.store(NamespaceState::Terminate);
      m_shutdownSignal.Set();
      ThrowIfFailed(std::move(failures), "stopping");
      return;
    }
    m_state.store(NamespaceState::Close);

    auto logger = Log::GetLogger();
    const char* const what = terminate ? "Terminating" : "Stopping";
    for (auto itr = components.rbegin(); itr != components.rend(); ++itr)
    {
      const auto& component = *itr;
      if (component)
      {
        logger->debug("{} {}...", what, component->GetQualifiedName());
        RunShutdownStep(component->GetQualifiedName(), failureSink,
                        [&component, &parent, terminate]()
                        {
                          if (terminate)
                          {
                            component->Terminate(parent);
                          }
                          else
                          {
                            component->Stop(parent);
                          }
                        });
      }
    }

    if (m_hooks.OnStopped)
    {
      RunShutdownStep("OnStopped", failureSink, m_hooks.OnStopped);
    }

    m_state.store(NamespaceState::Terminate);
    m_shutdownSignal.Set();
    ThrowIfFailed(std::move(failures), terminate ? "terminating" : "stopping");
  }

  void Namespace::Terminate(IComponentHost& parent)
  {
    Stop(parent, true);
  }

  bool Namespace::Join(std::optional<std::chrono::milliseconds> timeout) const
  {
    return m_shutdownSignal.Wait(timeout);
  }

  boost::asio::awaitable<bool> Namespace::JoinAsync(std::optional<std::chrono::milliseconds> timeout)
  {
    try
    {
      co_return co_await m_shutdownSignal.AsyncWait(timeout);
    }
    catch (const boost::system::system_error& ex)
    {
      if (ex.code() != boost::asio::error::operation_aborted)
      {
        throw;
      }
      Log::GetLogger()->warn("Namespace::JoinAsync: wait for '{}' was cancelled", m_name);
    }
    co_return true;
  }

  const ComponentBlueprint& Namespace::GetBlueprint(const std::string& name) const
  {
    auto itr = std::find_if(m_blueprints.begin(), m_blueprints.end(), [&name](const ComponentBlueprint& entry) { return entry.Name == name; });
    if (itr == m_blueprints.end())
    {
      throw std::out_of_range(fmt::format("Namespace '{}' has no component named '{}'", m_name, name));
    }
    return *itr;
  }

  std::vector<std::string> Namespace::ResolveBootOrder() const
  {
    auto logger = Log::GetLogger();

    DependencyGraph graph;
    std::unordered_set<std::string> names;
    for (const auto& blueprint : m_blueprints)
    {
      graph.AddNode(blueprint.Name);
      names.insert(blueprint.Name);
    }

    for (const auto& blueprint : m_blueprints)
    {
      for (const auto& required : blueprint.Requires)
      {
        if (names.find(required) == names.end())
        {
          logger->error("Namespace::ResolveBootOrder: {} requires unknown component '{}'", blueprint.GetQualifiedName(), required);
          throw UnknownComponentDependencyException(
            fmt::format("Component '{}' requires '{}' which is not registered in namespace '{}'", blueprint.GetQualifiedName(), required, m_name));
        }
        graph.AddEdge(blueprint.Name, required);
      }
    }

    std::vector<const ComponentBlueprint*> lastComponents;
    for (const auto& blueprint : m_blueprints)
    {
      if (blueprint.Last)
      {
        lastComponents.push_back(&blueprint);
      }
    }

    if (lastComponents.size() > 1u)
    {
      std::vector<std::string> lastNames;
      for (const auto* blueprint : lastComponents)
      {
        lastNames.push_back(blueprint->Name);
      }
      if (m_config.MultipleLast == MultipleLastPolicy::Reject)
      {
        logger->error("Namespace::ResolveBootOrder: namespace '{}' has several last components: {}", m_name, fmt::join(lastNames, ", "));
        throw ComponentResolutionException(
          fmt::format("Namespace '{}' has more than one last component: {}", m_name, fmt::join(lastNames, ", ")));
      }
      logger->warn("Namespace::ResolveBootOrder: namespace '{}' has several last components ({}), '{}' is pinned last", m_name,
                   fmt::join(lastNames, ", "), lastNames.front());
    }

    if (!lastComponents.empty())
    {
      const std::string& last = lastComponents.front()->Name;
      const std::vector<std::string> nodes = graph.GetNodes();
      for (const auto& node : nodes)
      {
        if (node != last)
        {
          graph.AddEdge(last, node);
        }
      }
    }

    return graph.TopologicalSort();
  }

  std::shared_ptr<Component> Namespace::BindComponent(const ComponentBlueprint& blueprint, IComponentHost& parent, const ComponentOptions& options)
  {
    auto component = blueprint.Factory(parent, options);
    if (!component)
    {
      Log::GetLogger()->error("Namespace::BindComponent: factory of {} returned null", blueprint.GetQualifiedName());
      throw ComponentDefinitionException(fmt::format("Factory of component '{}' returned null", blueprint.GetQualifiedName()));
    }
    component->Attach(blueprint, *this);
    return component;
  }

  void Namespace::CloseComponents(IComponentHost& parent, std::vector<ComponentFailure>* failures)
  {
    if (m_hooks.OnClose)
    {
      RunShutdownStep("OnClose", failures, m_hooks.OnClose);
    }
    for (const auto& component : parent.GetComponents())
    {
      if (component)
      {
        RunShutdownStep(component->GetQualifiedName(), failures, [&component, &parent]() { component->Close(parent); });
      }
    }
  }

  void Namespace::RunShutdownStep(const std::string& stepName, std::vector<ComponentFailure>* failures, const std::function<void()>& step)
  {
    if (failures == nullptr)
    {
      step();
      return;
    }

    try
    {
      step();
    }
    catch (const std::exception& ex)
    {
      Log::GetLogger()->warn("Namespace::RunShutdownStep: {} failed during shutdown of '{}': {}", stepName, m_name, ex.what());
      failures->push_back(ComponentFailure{stepName, std::current_exception()});
    }
    catch (...)
    {
      Log::GetLogger()->warn("Namespace::RunShutdownStep: {} failed during shutdown of '{}' with an unknown exception", stepName, m_name);
      failures->push_back(ComponentFailure{stepName, std::current_exception()});
    }
  }

  void Namespace::ThrowIfFailed(std::vector<ComponentFailure> failures, std::string_view operation) const
  {
    if (failures.empty())
    {
      return;
    }
    const auto count = failures.size();
    throw ShutdownAggregateException(fmt::format("{} failure(s) while {} namespace '{}'", count, operation, m_name), std::move(failures));
  }

  void Namespace::Debug(std::string_view message) const
  {
    Log::GetLogger()->debug("[{}] {}", m_displayName, message);
  }
}
