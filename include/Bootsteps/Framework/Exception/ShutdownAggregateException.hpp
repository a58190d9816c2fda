#ifndef BOOTSTEPS_FRAMEWORK_EXCEPTION_SHUTDOWNAGGREGATEEXCEPTION_HPP
#define BOOTSTEPS_FRAMEWORK_EXCEPTION_SHUTDOWNAGGREGATEEXCEPTION_HPP
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

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace Bootsteps
{
  /// @brief A single component failure collected during shutdown.
  struct ComponentFailure
  {
    /// @brief Qualified name ("namespace.name") of the failing component, or the hook name.
    std::string ComponentName;

    /// @brief The exception the component call raised.
    std::exception_ptr Exception;
  };

  /// @brief Represents the failures collected while a namespace was shut down.
  ///
  /// Thrown by Namespace::Stop, Namespace::Terminate and Namespace::Close when the namespace is configured
  /// with ShutdownErrorPolicy::Continue. By the time it is thrown the shutdown has already run to completion,
  /// so the namespace is in its terminal state and the shutdown signal has fired.
  class ShutdownAggregateException : public std::runtime_error
  {
    std::vector<ComponentFailure> m_failures;

  public:
    /// @brief Creates the exception.
    /// @param message The error message, an empty message selects a default one.
    /// @param failures The collected failures.
    /// @throws std::invalid_argument if failures is empty.
    ShutdownAggregateException(const std::string& message, std::vector<ComponentFailure> failures);

    ShutdownAggregateException(const ShutdownAggregateException&) = default;
    ShutdownAggregateException(ShutdownAggregateException&&) = default;
    ShutdownAggregateException& operator=(const ShutdownAggregateException&) = delete;
    ShutdownAggregateException& operator=(ShutdownAggregateException&&) = delete;

    const std::vector<ComponentFailure>& GetFailures() const noexcept
    {
      return m_failures;
    }

    std::size_t FailureCount() const noexcept
    {
      return m_failures.size();
    }

    /// @brief Returns the message followed by one line per failure ("[i] component: what").
    std::string ToString() const;
  };
}

#endif
