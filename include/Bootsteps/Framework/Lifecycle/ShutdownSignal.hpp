#ifndef BOOTSTEPS_FRAMEWORK_LIFECYCLE_SHUTDOWNSIGNAL_HPP
#define BOOTSTEPS_FRAMEWORK_LIFECYCLE_SHUTDOWNSIGNAL_HPP
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

// Boost 1.74 awaitable.hpp uses std::exchange without including <utility>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace Bootsteps
{
  /// @brief One-shot event fired when a namespace has completed its shutdown.
  ///
  /// Once set the signal stays set. Any number of threads can block in Wait and any number of coroutines can
  /// suspend in AsyncWait; all of them are released when the signal is set.
  class ShutdownSignal
  {
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    bool m_isSet{false};

    /// @brief Timers of the coroutines suspended in AsyncWait. Owned by the waiting coroutine.
    std::map<std::uint64_t, std::weak_ptr<boost::asio::steady_timer>> m_asyncWaiters;
    std::uint64_t m_nextWaiterId{0};

  public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;
    ShutdownSignal(ShutdownSignal&&) = delete;
    ShutdownSignal& operator=(ShutdownSignal&&) = delete;

    /// @brief Sets the signal and releases every waiter.
    /// @return true for the call that set the signal, false if it was already set.
    bool Set();

    bool IsSet() const;

    /// @brief Blocks until the signal is set or the timeout elapses.
    /// @param timeout The maximum time to wait, std::nullopt waits forever.
    /// @return true if the signal is set.
    bool Wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    /// @brief Suspends the calling coroutine until the signal is set or the timeout elapses.
    ///
    /// The coroutine must run on an implicit or explicit strand (an io_context run by one thread, or a strand
    /// executor), since the release is posted to its executor.
    /// @return true if the signal is set, false on timeout.
    /// @throws boost::system::system_error with boost::asio::error::operation_aborted when the wait is
    ///         cancelled through CancelAsyncWaits before the signal was set.
    boost::asio::awaitable<bool> AsyncWait(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Cancels every pending AsyncWait without setting the signal.
    ///
    /// Called by a scheduler that is tearing down the coroutines that wait for the shutdown.
    void CancelAsyncWaits();

  private:
    void CancelTimers(std::map<std::uint64_t, std::weak_ptr<boost::asio::steady_timer>> waiters);
  };
}

#endif
