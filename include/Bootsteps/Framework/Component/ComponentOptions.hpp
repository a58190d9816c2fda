#ifndef BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENTOPTIONS_HPP
#define BOOTSTEPS_FRAMEWORK_COMPONENT_COMPONENTOPTIONS_HPP
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

#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace Bootsteps
{
  /// @brief Orchestration-time configuration handed to every component factory by Namespace::Apply.
  ///
  /// Values are stored as strings and converted on lookup, so a host can fill the options straight from
  /// command line arguments or a configuration file.
  class ComponentOptions
  {
    std::map<std::string, std::string, std::less<>> m_values;

  public:
    ComponentOptions() = default;

    ComponentOptions(std::initializer_list<std::pair<const std::string, std::string>> values)
      : m_values(values)
    {
    }

    void Set(const std::string& key, std::string value)
    {
      m_values.insert_or_assign(key, std::move(value));
    }

    bool Contains(const std::string& key) const
    {
      return m_values.find(key) != m_values.end();
    }

    bool Empty() const noexcept
    {
      return m_values.empty();
    }

    std::optional<std::string> TryGet(const std::string& key) const
    {
      auto itr = m_values.find(key);
      if (itr == m_values.end())
      {
        return std::nullopt;
      }
      return itr->second;
    }

    std::string GetOr(const std::string& key, std::string defaultValue) const
    {
      auto value = TryGet(key);
      return value ? std::move(*value) : std::move(defaultValue);
    }

    /// @brief Gets a value converted to T, or defaultValue when the key is absent.
    /// @throws std::invalid_argument if the stored value can not be converted to T.
    template <typename T>
    T GetAs(const std::string& key, const T defaultValue) const
    {
      auto itr = m_values.find(key);
      if (itr == m_values.end())
      {
        return defaultValue;
      }
      try
      {
        return boost::lexical_cast<T>(itr->second);
      }
      catch (const boost::bad_lexical_cast&)
      {
        throw std::invalid_argument(fmt::format("Component option '{}' has invalid value '{}'", key, itr->second));
      }
    }
  };
}

#endif
