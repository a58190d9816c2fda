#ifndef BOOTSTEPS_FRAMEWORK_COMPONENT_ISERVICE_HPP
#define BOOTSTEPS_FRAMEWORK_COMPONENT_ISERVICE_HPP
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

namespace Bootsteps
{
  /// @brief Base of every object a component creates.
  class IService
  {
  public:
    virtual ~IService() = default;
  };

  /// @brief A created service object that a StartStopComponent can start and stop.
  class IStartStopService : public IService
  {
  public:
    virtual void Start() = 0;
    virtual void Stop() = 0;
  };
}

#endif
