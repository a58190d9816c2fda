#ifndef BOOTSTEPS_FRAMEWORK_EXCEPTION_DEPENDENCYCYCLEEXCEPTION_HPP
#define BOOTSTEPS_FRAMEWORK_EXCEPTION_DEPENDENCYCYCLEEXCEPTION_HPP
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

#include <Bootsteps/Framework/Exception/ComponentResolutionException.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Bootsteps
{
  /// @brief Exception thrown when the requirements of a set of components form a cycle.
  ///
  /// No boot order exists for such a set. The participants are the nodes that are part of a
  /// cycle (a strongly connected group of more than one node, or a node requiring itself).
  class DependencyCycleException : public ComponentResolutionException
  {
    std::vector<std::string> m_participants;

  public:
    DependencyCycleException(const std::string& message, std::vector<std::string> participants)
      : ComponentResolutionException(message)
      , m_participants(std::move(participants))
    {
    }

    /// @brief Names of the components that take part in a cycle, in graph insertion order.
    const std::vector<std::string>& GetParticipants() const noexcept
    {
      return m_participants;
    }
  };
}

#endif
