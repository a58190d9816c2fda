#ifndef BOOTSTEPS_FRAMEWORK_REGISTRY_COMPONENTREGISTRY_HPP
#define BOOTSTEPS_FRAMEWORK_REGISTRY_COMPONENTREGISTRY_HPP
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
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Bootsteps
{
  /// @brief Table of component blueprints grouped by namespace.
  ///
  /// Blueprints are registered before any namespace is built, usually from the static ComponentRegistration
  /// objects of the component modules, and claimed by Namespace::Apply. Claiming does not drain the registry,
  /// so several namespaces with the same name can be applied in one process.
  ///
  /// Within a namespace the registration order is kept; it breaks ties in the boot order.
  ///
  /// All members are thread safe.
  class ComponentRegistry
  {
  private:
    mutable std::mutex m_mutex;

    /// @brief Key: namespace name. Value: blueprints in registration order.
    std::unordered_map<std::string, std::vector<ComponentBlueprint>> m_unclaimed;

  public:
    ComponentRegistry() = default;
    ~ComponentRegistry() = default;

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;
    ComponentRegistry(ComponentRegistry&&) = delete;
    ComponentRegistry& operator=(ComponentRegistry&&) = delete;

    /// @brief The process wide registry.
    static ComponentRegistry& GetGlobal();

    /// @brief Registers a blueprint.
    ///
    /// Abstract blueprints are ignored. When blueprint.Namespace is empty, blueprint.Name must be of the form
    /// "namespace.name" and is split at the first dot.
    ///
    /// @param blueprint The blueprint to register.
    /// @return true if the blueprint was registered, false if it was abstract.
    /// @throws ComponentDefinitionException if the blueprint has no name, no namespace or no factory.
    /// @throws DuplicateComponentRegistrationException if the namespace already has a component with that name.
    bool Register(ComponentBlueprint blueprint);

    /// @brief Returns the blueprints registered under a namespace in registration order.
    std::vector<ComponentBlueprint> Claim(const std::string& namespaceName) const;

    bool Contains(const std::string& namespaceName, const std::string& name) const;

    std::size_t GetNamespaceCount(const std::string& namespaceName) const;

    /// @brief Removes every blueprint registered under a namespace.
    /// @return The number of removed blueprints.
    std::size_t Clear(const std::string& namespaceName);
  };
}

#endif
