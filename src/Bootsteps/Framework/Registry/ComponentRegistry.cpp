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

#include <Bootsteps/Framework/Exception/ComponentDefinitionException.hpp>
#include <Bootsteps/Framework/Exception/DuplicateComponentRegistrationException.hpp>
#include <Bootsteps/Framework/Log/Log.hpp>
#include <Bootsteps/Framework/Registry/ComponentRegistry.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <utility>

namespace Bootsteps
{
  namespace
  {
    bool HasName(const std::vector<ComponentBlueprint>& blueprints, const std::string& name)
    {
      return std::any_of(blueprints.begin(), blueprints.end(), [&name](const ComponentBlueprint& entry) { return entry.Name == name; });
    }
  }

  ComponentRegistry& ComponentRegistry::GetGlobal()
  {
    static ComponentRegistry registry;
    return registry;
  }

  bool ComponentRegistry::Register(ComponentBlueprint blueprint)
  {
    auto logger = Log::GetLogger();
    if (blueprint.Abstract)
    {
      logger->debug("ComponentRegistry::Register: skipping abstract component '{}'", blueprint.Name);
      return false;
    }

    if (blueprint.Name.empty())
    {
      logger->error("ComponentRegistry::Register: component has no name");
      throw ComponentDefinitionException("Components must be named");
    }

    // "namespace.name" sets both fields
    if (blueprint.Namespace.empty())
    {
      const auto separator = blueprint.Name.find('.');
      if (separator == std::string::npos || separator == 0 || separator + 1 == blueprint.Name.size())
      {
        logger->error("ComponentRegistry::Register: component '{}' has no namespace", blueprint.Name);
        throw ComponentDefinitionException(
          fmt::format("Component '{}' must name its namespace, either as 'namespace.name' or through Namespace", blueprint.Name));
      }
      blueprint.Namespace = blueprint.Name.substr(0, separator);
      blueprint.Name = blueprint.Name.substr(separator + 1);
    }

    if (!blueprint.Factory)
    {
      logger->error("ComponentRegistry::Register: component '{}' has no factory", blueprint.GetQualifiedName());
      throw ComponentDefinitionException(fmt::format("Component '{}' has no factory", blueprint.GetQualifiedName()));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& bucket = m_unclaimed[blueprint.Namespace];
    if (HasName(bucket, blueprint.Name))
    {
      logger->error("ComponentRegistry::Register: component '{}' is already registered", blueprint.GetQualifiedName());
      throw DuplicateComponentRegistrationException(fmt::format("Component '{}' is already registered", blueprint.GetQualifiedName()));
    }

    logger->debug("ComponentRegistry::Register: registering component '{}' (requires: [{}], last: {}, enabled: {})", blueprint.GetQualifiedName(),
                  fmt::join(blueprint.Requires, ", "), blueprint.Last, blueprint.Enabled);
    bucket.push_back(std::move(blueprint));
    return true;
  }

  std::vector<ComponentBlueprint> ComponentRegistry::Claim(const std::string& namespaceName) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itr = m_unclaimed.find(namespaceName);
    if (itr == m_unclaimed.end())
    {
      return {};
    }
    return itr->second;
  }

  bool ComponentRegistry::Contains(const std::string& namespaceName, const std::string& name) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itr = m_unclaimed.find(namespaceName);
    return itr != m_unclaimed.end() && HasName(itr->second, name);
  }

  std::size_t ComponentRegistry::GetNamespaceCount(const std::string& namespaceName) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itr = m_unclaimed.find(namespaceName);
    return itr != m_unclaimed.end() ? itr->second.size() : 0u;
  }

  std::size_t ComponentRegistry::Clear(const std::string& namespaceName)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto itr = m_unclaimed.find(namespaceName);
    if (itr == m_unclaimed.end())
    {
      return 0u;
    }
    const std::size_t count = itr->second.size();
    m_unclaimed.erase(itr);
    return count;
  }
}
