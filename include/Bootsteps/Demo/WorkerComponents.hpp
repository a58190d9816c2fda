#ifndef BOOTSTEPS_DEMO_WORKERCOMPONENTS_HPP
#define BOOTSTEPS_DEMO_WORKERCOMPONENTS_HPP
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
#include <Bootsteps/Framework/Component/ComponentOptions.hpp>
#include <Bootsteps/Framework/Component/StartStopComponent.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace Bootsteps::Demo
{
  inline constexpr std::string_view WorkerNamespaceName = "worker";

  class WorkerHost;

  /// @brief "worker.timer": the heartbeat timer every other component builds on.
  class TimerComponent final : public StartStopComponent
  {
    std::chrono::milliseconds m_interval;

  public:
    TimerComponent(IComponentHost& parent, const ComponentOptions& options);

    std::shared_ptr<IService> Create(IComponentHost& parent) override;
  };

  /// @brief "worker.pool": the task pool. Excluded when the concurrency option is 0.
  class PoolComponent final : public StartStopComponent
  {
    std::size_t m_concurrency;

  public:
    PoolComponent(IComponentHost& parent, const ComponentOptions& options);

    std::shared_ptr<IService> Create(IComponentHost& parent) override;

    /// @brief Abandons the queued tasks instead of waiting for them.
    void Terminate(IComponentHost& parent) override;
  };

  /// @brief "worker.hub": prepares the event hub on the host. Creates no service object and is not started.
  class HubComponent final : public Component
  {
  public:
    HubComponent(IComponentHost& parent, const ComponentOptions& options);
  };

  /// @brief "worker.consumer": consumes tasks, booted after every other worker component.
  class ConsumerComponent final : public StartStopComponent
  {
    std::string m_queue;
    std::size_t m_prefetch;

  public:
    ConsumerComponent(IComponentHost& parent, const ComponentOptions& options);

    std::shared_ptr<IService> Create(IComponentHost& parent) override;
  };

  /// @brief Casts the host the worker components are applied to.
  /// @throws std::bad_cast if parent is not a WorkerHost.
  WorkerHost& AsWorkerHost(IComponentHost& parent);
}

#endif
