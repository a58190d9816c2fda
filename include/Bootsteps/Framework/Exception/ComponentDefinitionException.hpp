#ifndef BOOTSTEPS_FRAMEWORK_EXCEPTION_COMPONENTDEFINITIONEXCEPTION_HPP
#define BOOTSTEPS_FRAMEWORK_EXCEPTION_COMPONENTDEFINITIONEXCEPTION_HPP
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

#include <stdexcept>
#include <string>

namespace Bootsteps
{
  /// @brief Exception thrown when a component blueprint is malformed.
  ///
  /// Raised by ComponentRegistry::Register for a non-abstract blueprint without a name, without a namespace
  /// or without a factory, and while binding when a factory returns null or a start/stop component creates
  /// an object that cannot be started.
  class ComponentDefinitionException : public std::logic_error
  {
  public:
    explicit ComponentDefinitionException(const std::string& message)
      : std::logic_error(message)
    {
    }
  };
}

#endif
