#ifndef BOOTSTEPS_FRAMEWORK_LOG_LOG_HPP
#define BOOTSTEPS_FRAMEWORK_LOG_LOG_HPP
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

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace Bootsteps::Log
{
  /// @brief Name of the logger used by all framework code.
  inline constexpr std::string_view LoggerName = "bootsteps";

  /// @brief Gets or creates the framework logger.
  ///
  /// The logger is created on first use with the sinks of the spdlog default logger, so whatever
  /// sink and pattern configuration the host applies to the default logger also applies here.
  /// The level is taken from the spdlog registry on creation, so spdlog::set_level and
  /// SPDLOG_LEVEL=bootsteps=debug (after spdlog::cfg::load_env_levels) both apply.
  ///
  /// @return Shared pointer to the framework logger.
  std::shared_ptr<spdlog::logger> GetLogger();
}

#endif
