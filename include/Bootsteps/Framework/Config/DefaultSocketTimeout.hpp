#ifndef BOOTSTEPS_FRAMEWORK_CONFIG_DEFAULTSOCKETTIMEOUT_HPP
#define BOOTSTEPS_FRAMEWORK_CONFIG_DEFAULTSOCKETTIMEOUT_HPP
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

#include <chrono>
#include <optional>

namespace Bootsteps
{
  /// @brief Process-wide default timeout for blocking network operations.
  ///
  /// Services started by components read this value when they open sockets or wait on network I/O.
  /// std::nullopt means "no timeout". The value is global mutable state: Namespace::Stop lowers it for the
  /// duration of a shutdown through ScopedSocketTimeout so a hung socket operation inside a component's
  /// stop call can not block the shutdown forever.
  namespace DefaultSocketTimeout
  {
    /// @brief Gets the current default timeout.
    std::optional<std::chrono::milliseconds> Get() noexcept;

    /// @brief Sets the default timeout. Negative durations are clamped to zero.
    void Set(std::optional<std::chrono::milliseconds> timeout) noexcept;
  }

  /// @brief Overrides DefaultSocketTimeout for the lifetime of the object.
  ///
  /// While several overrides are alive (for example two namespaces stopping on different threads) the newest
  /// one still alive decides the value, whatever order they end in. When the last one ends the value that was
  /// current before the first one is restored, on every exit path of the enclosing scope including exceptions.
  class ScopedSocketTimeout
  {
    std::optional<std::chrono::milliseconds> m_previous;

  public:
    explicit ScopedSocketTimeout(std::optional<std::chrono::milliseconds> timeout);
    ~ScopedSocketTimeout();

    ScopedSocketTimeout(const ScopedSocketTimeout&) = delete;
    ScopedSocketTimeout& operator=(const ScopedSocketTimeout&) = delete;
    ScopedSocketTimeout(ScopedSocketTimeout&&) = delete;
    ScopedSocketTimeout& operator=(ScopedSocketTimeout&&) = delete;

    /// @brief The value that was current when this override was created.
    std::optional<std::chrono::milliseconds> GetPrevious() const noexcept
    {
      return m_previous;
    }
  };
}

#endif
