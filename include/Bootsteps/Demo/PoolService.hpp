#ifndef BOOTSTEPS_DEMO_POOLSERVICE_HPP
#define BOOTSTEPS_DEMO_POOLSERVICE_HPP
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

#include <Bootsteps/Framework/Component/IService.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace Bootsteps::Demo
{
  /// @brief Runs submitted tasks on a fixed number of threads.
  ///
  /// Stop waits for the queued tasks, Terminate abandons them.
  class PoolService final : public IStartStopService
  {
    std::size_t m_concurrency;
    std::mutex m_mutex;
    std::unique_ptr<boost::asio::thread_pool> m_pool;

  public:
    explicit PoolService(const std::size_t concurrency)
      : m_concurrency(concurrency)
    {
    }

    ~PoolService() override
    {
      Terminate();
    }

    PoolService(const PoolService&) = delete;
    PoolService& operator=(const PoolService&) = delete;

    void Start() override
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (!m_pool)
      {
        m_pool = std::make_unique<boost::asio::thread_pool>(m_concurrency);
        spdlog::info("PoolService: started with {} threads", m_concurrency);
      }
    }

    void Stop() override
    {
      auto pool = Release();
      if (pool)
      {
        pool->join();
        spdlog::info("PoolService: stopped");
      }
    }

    void Terminate()
    {
      auto pool = Release();
      if (pool)
      {
        pool->stop();
        pool->join();
        spdlog::info("PoolService: terminated");
      }
    }

    /// @throws std::logic_error if the pool is not running.
    void Submit(std::function<void()> task)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (!m_pool)
      {
        throw std::logic_error("PoolService: Submit called while the pool is not running");
      }
      boost::asio::post(*m_pool, std::move(task));
    }

    std::size_t GetConcurrency() const noexcept
    {
      return m_concurrency;
    }

  private:
    std::unique_ptr<boost::asio::thread_pool> Release()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return std::move(m_pool);
    }
  };
}

#endif
