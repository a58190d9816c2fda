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

#include <Bootsteps/Framework/Lifecycle/ShutdownSignal.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <utility>

namespace Bootsteps
{
  bool ShutdownSignal::Set()
  {
    std::map<std::uint64_t, std::weak_ptr<boost::asio::steady_timer>> waiters;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_isSet)
      {
        return false;
      }
      m_isSet = true;
      waiters = m_asyncWaiters;
    }
    m_condition.notify_all();
    CancelTimers(std::move(waiters));
    return true;
  }

  bool ShutdownSignal::IsSet() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_isSet;
  }

  bool ShutdownSignal::Wait(std::optional<std::chrono::milliseconds> timeout) const
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!timeout.has_value())
    {
      m_condition.wait(lock, [this] { return m_isSet; });
      return true;
    }
    return m_condition.wait_for(lock, *timeout, [this] { return m_isSet; });
  }

  boost::asio::awaitable<bool> ShutdownSignal::AsyncWait(std::optional<std::chrono::milliseconds> timeout)
  {
    auto executor = co_await boost::asio::this_coro::executor;
    auto timer = std::make_shared<boost::asio::steady_timer>(executor);
    if (timeout.has_value())
    {
      timer->expires_after(*timeout);
    }
    else
    {
      timer->expires_at(boost::asio::steady_timer::time_point::max());
    }

    std::uint64_t waiterId = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_isSet)
      {
        co_return true;
      }
      waiterId = m_nextWaiterId++;
      m_asyncWaiters.emplace(waiterId, timer);
    }

    boost::system::error_code error;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));

    bool isSet = false;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_asyncWaiters.erase(waiterId);
      isSet = m_isSet;
    }

    if (isSet)
    {
      co_return true;
    }
    if (error == boost::asio::error::operation_aborted)
    {
      throw boost::system::system_error(error);
    }
    co_return false;
  }

  void ShutdownSignal::CancelAsyncWaits()
  {
    std::map<std::uint64_t, std::weak_ptr<boost::asio::steady_timer>> waiters;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      waiters = m_asyncWaiters;
    }
    CancelTimers(std::move(waiters));
  }

  void ShutdownSignal::CancelTimers(std::map<std::uint64_t, std::weak_ptr<boost::asio::steady_timer>> waiters)
  {
    // Timers are not thread safe, so the cancel runs on the executor of the waiting coroutine
    for (auto& [id, weakTimer] : waiters)
    {
      if (auto timer = weakTimer.lock())
      {
        boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
      }
    }
  }
}
