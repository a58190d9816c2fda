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

#include <Bootsteps/Demo/WorkerComponents.hpp>
#include <Bootsteps/Demo/WorkerHost.hpp>
#include <Bootsteps/Framework/Component/ComponentOptions.hpp>
#include <Bootsteps/Framework/Exception/ShutdownAggregateException.hpp>
#include <Bootsteps/Framework/Lifecycle/Namespace.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>

namespace
{
  // Arguments are "key=value" component options, for example pool.concurrency=2 timer.interval_ms=500
  Bootsteps::ComponentOptions ParseOptions(int argc, char* argv[])
  {
    Bootsteps::ComponentOptions options;
    for (int i = 1; i < argc; ++i)
    {
      const std::string argument(argv[i]);
      const auto separator = argument.find('=');
      if (separator == std::string::npos || separator == 0)
      {
        spdlog::warn("Ignoring argument '{}', expected key=value", argument);
        continue;
      }
      options.Set(argument.substr(0, separator), argument.substr(separator + 1));
    }
    return options;
  }

  // Returns false when the shutdown failed before the namespace reached its terminal state
  bool Shutdown(Bootsteps::Namespace& worker, Bootsteps::Demo::WorkerHost& host, const bool terminate)
  {
    try
    {
      if (terminate)
      {
        worker.Terminate(host);
      }
      else
      {
        worker.Stop(host);
      }
    }
    catch (const Bootsteps::ShutdownAggregateException& ex)
    {
      spdlog::error("{}", ex.ToString());
    }
    catch (const std::exception& ex)
    {
      spdlog::error("Shutdown failed: {}", ex.what());
      return false;
    }
    return true;
  }
}

int main(int argc, char* argv[])
{
  spdlog::cfg::load_env_levels();

  const Bootsteps::ComponentOptions options = ParseOptions(argc, argv);

  boost::asio::io_context ioContext;
  Bootsteps::Demo::WorkerHost host(ioContext, boost::asio::ip::host_name());

  Bootsteps::NamespaceHooks hooks;
  hooks.OnStart = [&host]() { spdlog::info("worker@{} starting", host.GetHostname()); };
  hooks.OnStopped = [&host]() { spdlog::info("worker@{} stopped", host.GetHostname()); };

  Bootsteps::NamespaceConfig config;
  config.ErrorPolicy = Bootsteps::ShutdownErrorPolicy::Continue;

  Bootsteps::Namespace worker(std::string(Bootsteps::Demo::WorkerNamespaceName), std::move(hooks), config);
  try
  {
    worker.Apply(host, options);
    worker.Start(host);
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("worker failed to boot: {}", ex.what());
    if (!Shutdown(worker, host, true))
    {
      spdlog::critical("worker did not shut down cleanly");
    }
    return EXIT_FAILURE;
  }

  int exitCode = EXIT_SUCCESS;
  auto fail = [&exitCode, &ioContext]()
  {
    exitCode = EXIT_FAILURE;
    ioContext.stop();
  };

  // SIGINT shuts down gracefully, SIGTERM terminates
  boost::asio::signal_set signals(ioContext, SIGINT, SIGTERM);
  signals.async_wait(
    [&](const boost::system::error_code& error, const int signalNumber)
    {
      if (error)
      {
        return;
      }
      spdlog::info("Received signal {}", signalNumber);
      if (!Shutdown(worker, host, signalNumber == SIGTERM))
      {
        fail();
      }
    });

  boost::asio::steady_timer runTimer(ioContext);
  const auto runFor = options.GetAs<long>("worker.run_for_ms", 0);
  if (runFor > 0)
  {
    runTimer.expires_after(std::chrono::milliseconds(runFor));
    runTimer.async_wait(
      [&](const boost::system::error_code& error)
      {
        if (error)
        {
          return;
        }
        if (!Shutdown(worker, host, false))
        {
          fail();
        }
      });
  }

  boost::asio::co_spawn(ioContext, worker.JoinAsync(),
                        [&](std::exception_ptr ex, bool /*completed*/)
                        {
                          signals.cancel();
                          runTimer.cancel();
                          if (ex)
                          {
                            try
                            {
                              std::rethrow_exception(ex);
                            }
                            catch (const std::exception& joinError)
                            {
                              spdlog::error("Join failed: {}", joinError.what());
                            }
                            fail();
                            return;
                          }
                          spdlog::info("worker shut down");
                        });

  ioContext.run();
  return exitCode;
}
