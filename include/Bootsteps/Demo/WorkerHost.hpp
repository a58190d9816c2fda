#ifndef BOOTSTEPS_DEMO_WORKERHOST_HPP
#define BOOTSTEPS_DEMO_WORKERHOST_HPP
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

#include <Bootsteps/Demo/HeartbeatService.hpp>
#include <Bootsteps/Demo/PoolService.hpp>
#include <Bootsteps/Framework/Host/ComponentHost.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>

namespace Bootsteps::Demo
{
  /// @brief The host the "worker" namespace is applied to.
  ///
  /// Components publish the services they create here so later components can use them.
  class WorkerHost final : public ComponentHost
  {
    boost::asio::io_context& m_ioContext;
    std::string m_hostname;

  public:
    std::shared_ptr<HeartbeatService> Timer;
    std::shared_ptr<PoolService> Pool;
    bool HubReady{false};

    WorkerHost(boost::asio::io_context& ioContext, std::string hostname)
      : m_ioContext(ioContext)
      , m_hostname(std::move(hostname))
    {
    }

    boost::asio::io_context& GetIoContext() noexcept
    {
      return m_ioContext;
    }

    const std::string& GetHostname() const noexcept
    {
      return m_hostname;
    }
  };
}

#endif
