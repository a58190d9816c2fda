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

#include <Bootsteps/Demo/ConsumerService.hpp>
#include <Bootsteps/Demo/HeartbeatService.hpp>
#include <Bootsteps/Demo/PoolService.hpp>
#include <Bootsteps/Demo/WorkerComponents.hpp>
#include <Bootsteps/Demo/WorkerHost.hpp>
#include <Bootsteps/Framework/Registry/ComponentRegistration.hpp>
#include <spdlog/spdlog.h>
#include <typeinfo>

namespace Bootsteps::Demo
{
  namespace
  {
    const ComponentRegistration<TimerComponent> g_timer({.Name = "timer", .Namespace = std::string(WorkerNamespaceName)});
    const ComponentRegistration<PoolComponent> g_pool({.Name = "pool", .Namespace = std::string(WorkerNamespaceName), .Requires = {"timer"}});
    const ComponentRegistration<HubComponent> g_hub({.Name = "hub", .Namespace = std::string(WorkerNamespaceName), .Requires = {"timer"}});
    const ComponentRegistration<ConsumerComponent> g_consumer({.Name = "consumer", .Namespace = std::string(WorkerNamespaceName), .Last = true});
  }

  WorkerHost& AsWorkerHost(IComponentHost& parent)
  {
    return dynamic_cast<WorkerHost&>(parent);
  }

  TimerComponent::TimerComponent(IComponentHost& /*parent*/, const ComponentOptions& options)
    : m_interval(options.GetAs<long>("timer.interval_ms", 1000))
  {
  }

  std::shared_ptr<IService> TimerComponent::Create(IComponentHost& parent)
  {
    auto& host = AsWorkerHost(parent);
    host.Timer = std::make_shared<HeartbeatService>(host.GetIoContext(), m_interval);
    return host.Timer;
  }

  PoolComponent::PoolComponent(IComponentHost& /*parent*/, const ComponentOptions& options)
    : m_concurrency(options.GetAs<std::size_t>("pool.concurrency", 4u))
  {
    SetEnabled(m_concurrency > 0u);
  }

  std::shared_ptr<IService> PoolComponent::Create(IComponentHost& parent)
  {
    auto& host = AsWorkerHost(parent);
    host.Pool = std::make_shared<PoolService>(m_concurrency);
    return host.Pool;
  }

  void PoolComponent::Terminate(IComponentHost& /*parent*/)
  {
    if (auto pool = GetObjectAs<PoolService>())
    {
      pool->Terminate();
    }
  }

  HubComponent::HubComponent(IComponentHost& parent, const ComponentOptions& /*options*/)
  {
    auto& host = AsWorkerHost(parent);
    host.HubReady = true;
    spdlog::info("HubComponent: event hub ready on {}", host.GetHostname());
  }

  ConsumerComponent::ConsumerComponent(IComponentHost& /*parent*/, const ComponentOptions& options)
    : m_queue(options.GetOr("consumer.queue", "celery"))
    , m_prefetch(options.GetAs<std::size_t>("consumer.prefetch", 4u))
  {
  }

  std::shared_ptr<IService> ConsumerComponent::Create(IComponentHost& parent)
  {
    return std::make_shared<ConsumerService>(m_queue, m_prefetch, AsWorkerHost(parent).Pool);
  }
}
