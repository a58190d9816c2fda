#ifndef BOOTSTEPS_FRAMEWORK_MODULE_MODULELOADER_HPP
#define BOOTSTEPS_FRAMEWORK_MODULE_MODULELOADER_HPP
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

#include <Bootsteps/Framework/Exception/ModuleImportException.hpp>
#include <boost/dll/shared_library.hpp>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Bootsteps
{
  /// @brief A "module:symbol" identifier split in its two parts.
  struct QualifiedSymbol
  {
    std::string Module;
    std::string Symbol;
  };

  /// @brief Loads component modules (shared libraries) and creates objects from factories they export.
  ///
  /// A module is loaded once and stays loaded for the lifetime of the loader, so objects created from it and
  /// the blueprints its static ComponentRegistration objects registered stay valid. Module identifiers are
  /// library names or paths; the platform prefix and suffix are appended when needed and the system library
  /// folders are searched.
  ///
  /// Factories are exported from a module with BOOST_DLL_ALIAS and must have the signature std::shared_ptr<T>().
  class ModuleLoader
  {
    mutable std::mutex m_mutex;
    std::map<std::string, boost::dll::shared_library> m_modules;

  public:
    ModuleLoader() = default;

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;
    ModuleLoader(ModuleLoader&&) = delete;
    ModuleLoader& operator=(ModuleLoader&&) = delete;

    /// @brief The loader used by Namespace::ImportModule and Component::Instantiate. It is never destroyed, so
    /// the modules it imports stay loaded until the process exits.
    static ModuleLoader& GetGlobal();

    /// @brief Loads a module. Loading an already loaded module does nothing.
    /// @throws ModuleImportException if the module can not be loaded.
    void Import(const std::string& module);

    bool IsImported(const std::string& module) const;

    std::vector<std::string> GetImportedModules() const;

    /// @brief Splits "module:symbol". The module part may itself contain ':' (Windows drive letters), the last
    /// separator wins.
    /// @throws ModuleImportException if either part is empty.
    static QualifiedSymbol ParseQualifiedName(const std::string& qualifiedName);

    /// @brief Imports the module of qualifiedName and calls the std::shared_ptr<T>() factory exported under the
    /// symbol name.
    /// @throws ModuleImportException if the module can not be loaded or does not export the symbol.
    template <typename T>
    std::shared_ptr<T> Instantiate(const std::string& qualifiedName)
    {
      const QualifiedSymbol symbol = ParseQualifiedName(qualifiedName);
      Import(symbol.Module);

      std::shared_ptr<T> (*factory)() = nullptr;
      {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto& library = m_modules.at(symbol.Module);
        if (!library.has(symbol.Symbol))
        {
          throw ModuleImportException(fmt::format("Module '{}' does not export '{}'", symbol.Module, symbol.Symbol));
        }
        factory = &library.get_alias<std::shared_ptr<T>()>(symbol.Symbol);
      }
      // Modules are never unloaded, the factory stays valid after the lock is released
      return factory();
    }
  };
}

#endif
