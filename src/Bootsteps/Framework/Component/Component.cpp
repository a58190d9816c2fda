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
#include <Bootsteps/Framework/Host/IComponentHost.hpp>
#include <Bootsteps/Framework/Log/Log.hpp>

namespace Bootsteps
{
  std::string Component::GetQualifiedName() const
  {
    return m_namespaceName.empty() ? m_name : m_namespaceName + "." + m_name;
  }

  std::shared_ptr<IService> Component::Create(IComponentHost& /*parent*/)
  {
    return nullptr;
  }

  bool Component::IncludeIf(IComponentHost& /*parent*/)
  {
    return IsEnabled();
  }

  bool Component::Include(IComponentHost& parent)
  {
    if (!IncludeIf(parent))
    {
      Log::GetLogger()->debug("Component {} is disabled, not included", GetQualifiedName());
      return false;
    }
    m_obj = Create(parent);
    return true;
  }

  void Component::Attach(const ComponentBlueprint& blueprint, Namespace& owner)
  {
    m_name = blueprint.Name;
    m_namespaceName = blueprint.Namespace;
    m_requires = blueprint.Requires;
    m_last = blueprint.Last;
    m_blueprintEnabled = blueprint.Enabled;
    m_namespace = &owner;
  }
}
