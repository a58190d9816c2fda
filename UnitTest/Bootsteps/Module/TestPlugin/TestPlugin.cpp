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

#include <Bootsteps/Framework/Component/IService.hpp>
#include <Bootsteps/Framework/Component/StartStopComponent.hpp>
#include <Bootsteps/Framework/Registry/ComponentRegistration.hpp>
#include <boost/dll/alias.hpp>
#include <memory>

// Component module loaded by ModuleLoaderTest. Loading it registers "plugin_test.greeter" in the global registry
// and exports the create_greeter factory.
namespace BootstepsTestPlugin
{
  class GreeterService final : public Bootsteps::IStartStopService
  {
    int m_starts{0};

  public:
    void Start() override
    {
      ++m_starts;
    }

    void Stop() override
    {
    }

    int GetStartCount() const noexcept
    {
      return m_starts;
    }
  };

  class GreeterComponent final : public Bootsteps::StartStopComponent
  {
  public:
    std::shared_ptr<Bootsteps::IService> Create(Bootsteps::IComponentHost& /*parent*/) override
    {
      return std::make_shared<GreeterService>();
    }
  };

  std::shared_ptr<Bootsteps::IService> CreateGreeter()
  {
    return std::make_shared<GreeterService>();
  }

  const Bootsteps::ComponentRegistration<GreeterComponent> g_greeter({.Name = "plugin_test.greeter"});
}

BOOST_DLL_ALIAS(BootstepsTestPlugin::CreateGreeter, create_greeter)
