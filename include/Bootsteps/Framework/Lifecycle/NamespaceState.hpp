#ifndef BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACESTATE_HPP
#define BOOTSTEPS_FRAMEWORK_LIFECYCLE_NAMESPACESTATE_HPP
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

#include <string_view>

namespace Bootsteps
{
  /// @brief Lifecycle state of a Namespace. Transitions only move forward.
  enum class NamespaceState
  {
    Unset = 0,
    Run = 1,
    Close = 2,
    Terminate = 3
  };

  constexpr std::string_view ToString(const NamespaceState state) noexcept
  {
    switch (state)
    {
    case NamespaceState::Unset:
      return "Unset";
    case NamespaceState::Run:
      return "Run";
    case NamespaceState::Close:
      return "Close";
    case NamespaceState::Terminate:
      return "Terminate";
    }
    return "Unknown";
  }
}

#endif
