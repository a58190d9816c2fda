#ifndef BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENT_HPP
#define BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENT_HPP
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
#include <Bootsteps/Framework/Component/IService.hpp>
#include <Bootsteps/Framework/Module/ModuleLoader.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Bootsteps
{
  class IComponentHost;
  class Namespace;

  /// @brief A component bound to a host.
  ///
  /// The constructor runs when the component is bound to a host (Namespace::Apply), so it can be used to
  /// initialize state on the host at host construction time. After binding the component knows its blueprint
  /// metadata and the namespace that owns it.
  class Component : public std::enable_shared_from_this<Component>
  {
    friend class Namespace;

    std::string m_name;
    std::string m_namespaceName;
    std::vector<std::string> m_requires;
    bool m_last{false};
    bool m_blueprintEnabled{true};
    std::optional<bool> m_enabled;

    // Owning namespace, not owned
    Namespace* m_namespace{nullptr};

    std::shared_ptr<IService> m_obj;

  public:
    Component() = default;
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;
    Component(Component&&) = delete;
    Component& operator=(Component&&) = delete;

    const std::string& GetName() const noexcept
    {
      return m_name;
    }

    const std::string& GetNamespaceName() const noexcept
    {
      return m_namespaceName;
    }

    /// @brief "namespace.name", used in log output.
    std::string GetQualifiedName() const;

    const std::vector<std::string>& GetRequires() const noexcept
    {
      return m_requires;
    }

    bool IsLast() const noexcept
    {
      return m_last;
    }

    /// @brief The blueprint's Enabled flag unless the component changed it with SetEnabled.
    bool IsEnabled() const noexcept
    {
      return m_enabled.value_or(m_blueprintEnabled);
    }

    /// @brief The namespace that bound this component, or nullptr before binding.
    Namespace* GetNamespace() const noexcept
    {
      return m_namespace;
    }

    /// @brief The object returned by Create, null when the component was not included or created nothing.
    const std::shared_ptr<IService>& GetObject() const noexcept
    {
      return m_obj;
    }

    template <typename T>
    std::shared_ptr<T> GetObjectAs() const
    {
      return std::dynamic_pointer_cast<T>(m_obj);
    }

    /// @brief Creates the service object of this component.
    /// @return The created object, or null when the component has no runtime object.
    virtual std::shared_ptr<IService> Create(IComponentHost& parent);

    /// @brief Decides whether the component is included. Defaults to IsEnabled().
    virtual bool IncludeIf(IComponentHost& parent);

    /// @brief Creates the object when IncludeIf allows it.
    /// @return true if the component was included.
    virtual bool Include(IComponentHost& parent);

    /// @brief Creates an object from a "module:symbol" factory exported by a component module.
    template <typename T>
    std::shared_ptr<T> Instantiate(const std::string& qualifiedName) const
    {
      return ModuleLoader::GetGlobal().Instantiate<T>(qualifiedName);
    }

  protected:
    /// @brief Overrides the blueprint's Enabled flag, typically from the constructor based on host state.
    void SetEnabled(const bool enabled) noexcept
    {
      m_enabled = enabled;
    }

  private:
    void Attach(const ComponentBlueprint& blueprint, Namespace& owner);
  };
}

#endif
