#ifndef BOOTSTEPS_FRAMEWORK_HOST_COMPONENTHOST_HPP
#define BOOTSTEPS_FRAMEWORK_HOST_COMPONENTHOST_HPP
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

#include <Bootsteps/Framework/Host/IComponentHost.hpp>
#include <memory>
#include <vector>

namespace Bootsteps
{
  /// @brief Default host implementation that only owns the component list.
  ///
  /// Hosts that need more state (configuration consulted by IncludeIf, objects the components publish) derive
  /// from this class.
  class ComponentHost : public IComponentHost
  {
    std::vector<std::shared_ptr<StartStopComponent>> m_components;

  public:
    ComponentHost() = default;

    ComponentHost(const ComponentHost&) = delete;
    ComponentHost& operator=(const ComponentHost&) = delete;
    ComponentHost(ComponentHost&&) = delete;
    ComponentHost& operator=(ComponentHost&&) = delete;

    std::vector<std::shared_ptr<StartStopComponent>>& GetComponents() override
    {
      return m_components;
    }
  };
}

#endif
