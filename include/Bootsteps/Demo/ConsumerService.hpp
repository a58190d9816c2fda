#ifndef BOOTSTEPS_DEMO_CONSUMERSERVICE_HPP
#define BOOTSTEPS_DEMO_CONSUMERSERVICE_HPP
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

#include <Bootsteps/Demo/PoolService.hpp>
#include <Bootsteps/Framework/Component/IService.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>

namespace Bootsteps::Demo
{
  /// @brief Pretends to consume tasks from a broker and hands them to the pool.
  ///
  /// Without a pool the tasks run inline in Start.
  class ConsumerService final : public IStartStopService
  {
    std::string m_queue;
    std::size_t m_prefetch;
    std::shared_ptr<PoolService> m_pool;

  public:
    ConsumerService(std::string queue, const std::size_t prefetch, std::shared_ptr<PoolService> pool)
      : m_queue(std::move(queue))
      , m_prefetch(prefetch)
      , m_pool(std::move(pool))
    {
    }

    void Start() override
    {
      spdlog::info("ConsumerService: consuming from '{}'", m_queue);
      for (std::size_t i = 0; i < m_prefetch; ++i)
      {
        auto task = [queue = m_queue, i]() { spdlog::info("ConsumerService: task {} from '{}' done", i, queue); };
        if (m_pool)
        {
          m_pool->Submit(std::move(task));
        }
        else
        {
          task();
        }
      }
    }

    void Stop() override
    {
      spdlog::info("ConsumerService: stopped consuming from '{}'", m_queue);
    }
  };
}

#endif
