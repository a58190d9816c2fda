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
#include <string>

namespace Bootsteps::Log
{
  std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = []()
    {
      const std::string name(LoggerName);
      auto log = spdlog::get(name);
      if (!log)
      {
        // Use default logger's sinks - inherits global configuration
        auto defaultLogger = spdlog::default_logger();
        log = std::make_shared<spdlog::logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end());
        // Applies the registry level (including SPDLOG_LEVEL overrides) and registers the logger
        spdlog::initialize_logger(log);
      }
      return log;
    }();
    return logger;
  }
}
