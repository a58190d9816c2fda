#ifndef BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACECONFIG_HPP
#define BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACECONFIG_HPP
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
#include <functional>
#include <optional>

namespace Bootsteps
{
  /// @brief What Namespace::Stop does when a component fails to close, stop or terminate.
  enum class ShutdownErrorPolicy
  {
    /// @brief The first failure escapes the call and the remaining components are not visited.
    Propagate,
    /// @brief Every failure is logged and collected, the shutdown runs to completion and a
    /// ShutdownAggregateException is thrown afterwards.
    Continue
  };

  /// @brief What Namespace::Apply does when more than one component of the namespace is marked Last.
  enum class MultipleLastPolicy
  {
    /// @brief The first registered one is pinned last, the others are ordered normally. Logged as a warning.
    FirstRegisteredWins,
    /// @brief Throws ComponentResolutionException.
    Reject
  };

  /// @brief Configuration for Namespace.
  struct NamespaceConfig
  {
    /// @brief Default network timeout applied while Stop runs. std::nullopt means no timeout.
    std::optional<std::chrono::milliseconds> ShutdownSocketTimeout{std::chrono::milliseconds(5000)};

    ShutdownErrorPolicy ErrorPolicy{ShutdownErrorPolicy::Propagate};

    MultipleLastPolicy MultipleLast{MultipleLastPolicy::FirstRegisteredWins};
  };

  /// @brief Optional callbacks invoked by Namespace at lifecycle points.
  struct NamespaceHooks
  {
    /// @brief Called by Start after the state is set to Run and before any component starts.
    std::function<void()> OnStart;

    /// @brief Called by Close before the components are closed.
    std::function<void()> OnClose;

    /// @brief Called by Stop after every component was stopped or terminated.
    std::function<void()> OnStopped;
  };
}

#endif
