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

#include <Bootsteps/Framework/Component/StartStopComponent.hpp>
#include <Bootsteps/Framework/Exception/ComponentDefinitionException.hpp>
#include <Bootsteps/Framework/Host/IComponentHost.hpp>
#include <Bootsteps/Framework/Log/Log.hpp>
#include <fmt/format.h>

namespace Bootsteps
{
  void StartStopComponent::Start(IComponentHost& /*parent*/)
  {
    if (m_service)
    {
      m_service->Start();
    }
  }

  void StartStopComponent::Stop(IComponentHost& /*parent*/)
  {
    if (m_service)
    {
      m_service->Stop();
    }
  }

  void StartStopComponent::Close(IComponentHost& /*parent*/)
  {
  }

  void StartStopComponent::Terminate(IComponentHost& parent)
  {
    Stop(parent);
  }

  bool StartStopComponent::Include(IComponentHost& parent)
  {
    if (!Component::Include(parent))
    {
      return false;
    }

    const auto& obj = GetObject();
    m_service = std::dynamic_pointer_cast<IStartStopService>(obj);
    if (obj && !m_service)
    {
      Log::GetLogger()->error("StartStopComponent::Include: {} created an object that can not be started", GetQualifiedName());
      throw ComponentDefinitionException(fmt::format("Component '{}' created an object that is not an IStartStopService", GetQualifiedName()));
    }

    parent.GetComponents().push_back(std::static_pointer_cast<StartStopComponent>(shared_from_this()));
    return true;
  }
}
