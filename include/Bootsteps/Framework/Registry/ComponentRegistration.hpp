#ifndef BOOTSTEPS_FRAMEWORK_REGISTRY_COMPONENTREGISTRATION_HPP
#define BOOTSTEPS_FRAMEWORK_REGISTRY_COMPONENTREGISTRATION_HPP
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

#include <Bootsteps/Framework/Component/ComponentBlueprint.hpp>
#include <Bootsteps/Framework/Registry/ComponentRegistry.hpp>
#include <utility>

namespace Bootsteps
{
  /// @brief Registers a TComponent blueprint when constructed.
  ///
  /// Declared at namespace scope in a component module, the registration runs when the module is loaded, which
  /// is how Namespace::Modules() makes more components available to a namespace:
  ///
  /// @code
  /// const Bootsteps::ComponentRegistration<PoolComponent> g_pool({.Name = "worker.pool", .Requires = {"timer"}});
  /// @endcode
  ///
  /// A definition error thrown by the registry escapes the constructor, which for a namespace scope object
  /// terminates the program at load time.
  template <typename TComponent>
  class ComponentRegistration
  {
    bool m_registered{false};

  public:
    explicit ComponentRegistration(ComponentBlueprint blueprint, ComponentRegistry& registry = ComponentRegistry::GetGlobal())
      : m_registered(registry.Register(MakeBlueprint<TComponent>(std::move(blueprint))))
    {
    }

    /// @brief false when the blueprint was abstract.
    bool IsRegistered() const noexcept
    {
      return m_registered;
    }
  };
}

#endif
