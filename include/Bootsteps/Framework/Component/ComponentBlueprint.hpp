#ifndef BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENTBLUEPRINT_HPP
#define BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENTBLUEPRINT_HPP
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

#include <Bootsteps/Framework/Component/ComponentOptions.hpp>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Bootsteps
{
  class Component;
  class IComponentHost;

  /// @brief Creates the bound instance of a component for a host.
  using ComponentFactory = std::function<std::shared_ptr<Component>(IComponentHost& parent, const ComponentOptions& options)>;

  /// @brief Declarative description of one boot-step, not yet bound to any host.
  ///
  /// Blueprints are registered with a ComponentRegistry and claimed by the Namespace with the same name. The
  /// Factory is the constructive step: it is called once per Namespace::Apply with the host and the
  /// orchestration-time options.
  struct ComponentBlueprint
  {
    /// @brief Name of the component, unique within its namespace.
    /// May be given as "namespace.name" when Namespace is left empty.
    std::string Name;

    /// @brief Name of the owning namespace.
    std::string Namespace;

    /// @brief Names of components in the same namespace that must boot first.
    std::vector<std::string> Requires;

    /// @brief Forces the component after every other component of its namespace.
    bool Last{false};

    /// @brief Default of Component::IncludeIf.
    bool Enabled{true};

    /// @brief Abstract blueprints are never registered.
    bool Abstract{false};

    ComponentFactory Factory;

    std::string GetQualifiedName() const
    {
      return Namespace.empty() ? Name : Namespace + "." + Name;
    }
  };

  /// @brief Returns the blueprint with a Factory that creates a TComponent.
  ///
  /// TComponent is constructed from (IComponentHost&, const ComponentOptions&) when it has such a constructor,
  /// otherwise it is default constructed.
  template <typename TComponent>
  ComponentBlueprint MakeBlueprint(ComponentBlueprint blueprint)
  {
    static_assert(std::is_base_of_v<Component, TComponent>, "TComponent must derive from Component");

    blueprint.Factory = []([[maybe_unused]] IComponentHost& parent, [[maybe_unused]] const ComponentOptions& options) -> std::shared_ptr<Component>
    {
      if constexpr (std::is_constructible_v<TComponent, IComponentHost&, const ComponentOptions&>)
      {
        return std::make_shared<TComponent>(parent, options);
      }
      else
      {
        return std::make_shared<TComponent>();
      }
    };
    return blueprint;
  }
}

#endif
