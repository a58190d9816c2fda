#ifndef BOOTSTEPS_FRAMEWORK_COMPONENT_STARTSTOPCOMPONENT_HPP
#define BOOTSTEPS_FRAMEWORK_COMPONENT_STARTSTOPCOMPONENT_HPP
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

#include <Bootsteps/Framework/Component/Component.hpp>
#include <Bootsteps/Framework/Component/IService.hpp>
#include <memory>

namespace Bootsteps
{
  /// @brief A component that takes part in the namespace start/stop protocol.
  ///
  /// When included, the component appends itself to the host's component list, which is the list
  /// Namespace::Start, Stop, Close and Terminate operate on. By default the lifecycle calls are forwarded to the
  /// created IStartStopService. A component that created no object no-ops them unless it overrides them.
  class StartStopComponent : public Component
  {
    std::shared_ptr<IStartStopService> m_service;

  public:
    virtual void Start(IComponentHost& parent);
    virtual void Stop(IComponentHost& parent);

    /// @brief Called on every component before the namespace stops. No-op by default.
    virtual void Close(IComponentHost& parent);

    /// @brief Forced shutdown. Calls Stop by default.
    virtual void Terminate(IComponentHost& parent);

    /// @throws ComponentDefinitionException if the created object is not an IStartStopService.
    bool Include(IComponentHost& parent) override;

  protected:
    const std::shared_ptr<IStartStopService>& GetService() const noexcept
    {
      return m_service;
    }
  };
}

#endif
