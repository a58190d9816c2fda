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

#include <Bootsteps/Framework/Log/Log.hpp>
#include <Bootsteps/Framework/Module/ModuleLoader.hpp>
#include <boost/dll/shared_library_load_mode.hpp>
#include <boost/system/system_error.hpp>

namespace Bootsteps
{
  ModuleLoader& ModuleLoader::GetGlobal()
  {
    // Never destroyed: blueprints registered by a module hold code from it until the process exits
    static ModuleLoader* const loader = new ModuleLoader();
    return *loader;
  }

  void ModuleLoader::Import(const std::string& module)
  {
    if (module.empty())
    {
      throw ModuleImportException("Cannot import a module with an empty name");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_modules.find(module) != m_modules.end())
    {
      return;
    }

    Log::GetLogger()->debug("ModuleLoader::Import: loading module '{}'", module);
    try
    {
      // Static initializers of the module run here and may register components
      boost::dll::shared_library library(module, boost::dll::load_mode::append_decorations | boost::dll::load_mode::search_system_folders);
      m_modules.emplace(module, std::move(library));
    }
    catch (const boost::system::system_error& ex)
    {
      Log::GetLogger()->error("ModuleLoader::Import: failed to load module '{}': {}", module, ex.what());
      throw ModuleImportException(fmt::format("Failed to import module '{}': {}", module, ex.what()));
    }
  }

  bool ModuleLoader::IsImported(const std::string& module) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_modules.find(module) != m_modules.end();
  }

  std::vector<std::string> ModuleLoader::GetImportedModules() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_modules.size());
    for (const auto& [name, library] : m_modules)
    {
      result.push_back(name);
    }
    return result;
  }

  QualifiedSymbol ModuleLoader::ParseQualifiedName(const std::string& qualifiedName)
  {
    const auto separator = qualifiedName.rfind(':');
    if (separator == std::string::npos || separator == 0 || separator + 1 == qualifiedName.size())
    {
      throw ModuleImportException(fmt::format("'{}' is not a qualified 'module:symbol' name", qualifiedName));
    }
    return QualifiedSymbol{qualifiedName.substr(0, separator), qualifiedName.substr(separator + 1)};
  }
}
