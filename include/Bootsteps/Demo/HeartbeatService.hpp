#ifndef BOOTSTEPS_DEMO_HEARTBEATSERVICE_HPP
#define BOOTSTEPS_DEMO_HEARTBEATSERVICE_HPP
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
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace Bootsteps::Demo
{
  /// @brief Logs a heartbeat at a fixed interval on the worker's io_context.
  class HeartbeatService final
    : public IStartStopService
    , public std::enable_shared_from_this<HeartbeatService>
  {
    boost::asio::steady_timer m_timer;
    std::chrono::milliseconds m_interval;
    std::atomic<bool> m_running{false};
    std::uint64_t m_beats{0};

  public:
    HeartbeatService(boost::asio::io_context& ioContext, const std::chrono::milliseconds interval)
      : m_timer(ioContext)
      , m_interval(interval)
    {
    }

    void Start() override
    {
      spdlog::info("HeartbeatService: started, interval {}ms", m_interval.count());
      m_running = true;
      Schedule();
    }

    /// @brief Must be called on the io_context thread.
    void Stop() override
    {
      m_running = false;
      m_timer.cancel();
      spdlog::info("HeartbeatService: stopped after {} beats", m_beats);
    }

    std::uint64_t GetBeatCount() const noexcept
    {
      return m_beats;
    }

  private:
    void Schedule()
    {
      m_timer.expires_after(m_interval);
      m_timer.async_wait(
        [self = shared_from_this()](const boost::system::error_code& error)
        {
          if (error || !self->m_running)
          {
            return;
          }
          ++self->m_beats;
          spdlog::info("HeartbeatService: beat {}", self->m_beats);
          self->Schedule();
        });
    }
  };
}

#endif
