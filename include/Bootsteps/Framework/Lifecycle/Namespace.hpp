#ifndef BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACE_HPP
#define BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACE_HPP
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

#include <Bootsteps/Framework/Component/ComponentBlueprint.hpp>
#include <Bootsteps/Framework/Component/ComponentOptions.hpp>
#include <Bootsteps/Framework/Exception/ShutdownAggregateException.hpp>
#include <Bootsteps/Framework/Lifecycle/NamespaceConfig.hpp>
#include <Bootsteps/Framework/Lifecycle/NamespaceState.hpp>
#include <Bootsteps/Framework/Lifecycle/ShutdownSignal.hpp>
#include <Bootsteps/Framework/Registry/ComponentRegistry.hpp>
#include <boost/asio/awaitable.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Bootsteps
{
  class Component;
  class IComponentHost;

  /// @brief Builds and drives the components of one namespace for a host.
  ///
  /// Usage:
  /// 1. Register component blueprints under the namespace name (ComponentRegistration or
  ///    ComponentRegistry::Register).
  /// 2. Call Apply(host) once. It claims the blueprints, resolves the boot order, binds one component instance
  ///    per blueprint and lets each component include itself. Included StartStopComponents are appended to
  ///    host.GetComponents().
  /// 3. Call Start(host). The host components are started in list order.
  /// 4. Call Stop(host) or Terminate(host), usually from a signal handler. The components are stopped in
  ///    reverse order and the shutdown signal is set.
  /// 5. Join() or co_await JoinAsync() waits for the shutdown signal.
  ///
  /// The state only moves forward: Unset, Run, Close, Terminate. A Namespace can be applied and started once.
  class Namespace
  {
    std::string m_name;
    std::string m_displayName;
    NamespaceHooks m_hooks;
    NamespaceConfig m_config;
    ComponentRegistry& m_registry;

    std::atomic<bool> m_applied{false};
    std::atomic<NamespaceState> m_state{NamespaceState::Unset};
    std::atomic<std::size_t> m_started{0};
    std::atomic<bool> m_stopInProgress{false};

    /// @brief Claimed blueprints in registration order.
    std::vector<ComponentBlueprint> m_blueprints;
    std::vector<std::string> m_bootOrder;
    std::vector<std::shared_ptr<Component>> m_bootSteps;

    ShutdownSignal m_shutdownSignal;

  public:
    /// @brief Creates a namespace.
    /// @param name The namespace name, blueprints registered under this name are claimed by Apply.
    /// @param hooks Optional lifecycle callbacks.
    /// @param config Shutdown and resolution settings.
    /// @param registry The registry to claim blueprints from.
    /// @throws std::invalid_argument if name is empty.
    explicit Namespace(std::string name, NamespaceHooks hooks = {}, NamespaceConfig config = {},
                       ComponentRegistry& registry = ComponentRegistry::GetGlobal());
    virtual ~Namespace();

    Namespace(const Namespace&) = delete;
    Namespace& operator=(const Namespace&) = delete;
    Namespace(Namespace&&) = delete;
    Namespace& operator=(Namespace&&) = delete;

    /// @brief Modules to import before the components are claimed. None by default.
    virtual std::vector<std::string> Modules() const;

    /// @brief Imports every module returned by Modules().
    void LoadModules();

    /// @brief Builds the components of this namespace for the host.
    ///
    /// @param parent The host, passed to every factory and to Include.
    /// @param options Options passed to every component factory.
    /// @throws InvalidNamespaceStateException if the namespace was already applied.
    /// @throws ModuleImportException if a module from Modules() can not be imported.
    /// @throws UnknownComponentDependencyException if a component requires a name not claimed by this namespace.
    /// @throws DependencyCycleException if the requirements form a cycle.
    /// @throws ComponentResolutionException if several components are Last and the policy rejects it.
    /// @throws ComponentDefinitionException if a factory returns null or a created object can not be started.
    void Apply(IComponentHost& parent, const ComponentOptions& options = {});

    /// @brief Starts the host components in list order.
    ///
    /// The started count is updated before each component starts. A failing component propagates its exception
    /// unmodified and the state stays Run.
    /// @throws InvalidNamespaceStateException if the namespace was already started.
    void Start(IComponentHost& parent);

    /// @brief Calls the OnClose hook and Close on every host component.
    /// @throws ShutdownAggregateException on failures when the error policy is Continue.
    void Close(IComponentHost& parent);

    /// @brief Shuts the namespace down and sets the shutdown signal.
    ///
    /// Only the first call does anything; concurrent calls and calls after the shutdown return immediately.
    /// While it runs the process wide DefaultSocketTimeout is overridden with ShutdownSocketTimeout. When the
    /// namespace never fully started the components are closed but not stopped.
    ///
    /// With ShutdownErrorPolicy::Propagate a failing component stop escapes this call and leaves the state at
    /// Close with the shutdown signal not set; later Stop calls then do nothing.
    ///
    /// @param parent The host.
    /// @param terminate Calls Terminate instead of Stop on the components.
    /// @throws ShutdownAggregateException on failures when the error policy is Continue.
    void Stop(IComponentHost& parent, bool terminate = false);

    /// @brief Same as Stop(parent, true).
    void Terminate(IComponentHost& parent);

    /// @brief Blocks until the shutdown signal is set.
    ///
    /// With ShutdownErrorPolicy::Propagate a shutdown that failed in a component stop never sets the signal, so
    /// an untimed Join blocks forever. Pass a timeout, or use ShutdownErrorPolicy::Continue which always sets the
    /// signal before reporting the failures.
    /// @param timeout The maximum time to wait, std::nullopt waits forever.
    /// @return true if the shutdown completed, false on timeout.
    bool Join(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /// @brief Waits for the shutdown signal from a coroutine.
    ///
    /// A cancellation of the wait by the scheduler running the coroutine is treated as completion. The same
    /// caveat as Join applies to a failed shutdown under ShutdownErrorPolicy::Propagate.
    /// @return true if the shutdown completed or the wait was cancelled, false on timeout.
    boost::asio::awaitable<bool> JoinAsync(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    const std::string& GetName() const noexcept
    {
      return m_name;
    }

    NamespaceState GetState() const noexcept
    {
      return m_state.load();
    }

    /// @brief Index + 1 of the last host component that Start began starting.
    std::size_t GetStartedCount() const noexcept
    {
      return m_started.load();
    }

    const NamespaceConfig& GetConfig() const noexcept
    {
      return m_config;
    }

    /// @brief Every bound component in boot order, included or not.
    const std::vector<std::shared_ptr<Component>>& GetBootSteps() const noexcept
    {
      return m_bootSteps;
    }

    const std::vector<std::string>& GetBootOrder() const noexcept
    {
      return m_bootOrder;
    }

    /// @brief The blueprints claimed by Apply, in registration order.
    const std::vector<ComponentBlueprint>& GetBlueprints() const noexcept
    {
      return m_blueprints;
    }

    /// @brief Looks up a claimed blueprint by name.
    /// @throws std::out_of_range if no claimed blueprint has that name.
    const ComponentBlueprint& GetBlueprint(const std::string& name) const;

    ShutdownSignal& GetShutdownSignal() noexcept
    {
      return m_shutdownSignal;
    }

  protected:
    /// @brief Imports one component module. Uses the global ModuleLoader by default.
    virtual void ImportModule(const std::string& module);

  private:
    std::vector<std::string> ResolveBootOrder() const;
    std::shared_ptr<Component> BindComponent(const ComponentBlueprint& blueprint, IComponentHost& parent, const ComponentOptions& options);
    void CloseComponents(IComponentHost& parent, std::vector<ComponentFailure>* failures);
    void RunShutdownStep(const std::string& stepName, std::vector<ComponentFailure>* failures, const std::function<void()>& step);
    void ThrowIfFailed(std::vector<ComponentFailure> failures, std::string_view operation) const;
    void Debug(std::string_view message) const;
  };
}

#endif
