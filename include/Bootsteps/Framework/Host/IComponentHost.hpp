#ifndef BOOTSTEPS_FRAMEWORK_HOST_ICOMPONENTHOST_HPP
#define BOOTSTEPS_FRAMEWORK_HOST_ICOMPONENTHOST_HPP
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

#include <memory>
#include <vector>

namespace Bootsteps
{
  class StartStopComponent;

  /// @brief The object whose services a namespace orchestrates (the "parent").
  ///
  /// The host is passed unmodified to every component factory, Create, IncludeIf and lifecycle call. The only
  /// thing the framework requires from it is the ordered list that start/stop components append themselves
  /// to when they are included. That list is the operand of Namespace::Start, Stop, Close and Terminate.
  class IComponentHost
  {
  public:
    virtual ~IComponentHost() = default;

    virtual std::vector<std::shared_ptr<StartStopComponent>>& GetComponents() = 0;
  };
}

#endif
