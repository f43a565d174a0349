#ifndef GROUND_LEVEL_COMMON_LOGHELPER_HPP
#define GROUND_LEVEL_COMMON_LOGHELPER_HPP
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
#include <string>
#include <string_view>

namespace GroundLevel::LogHelper
{
  /// @brief Name of the logger shared by the GroundLevel library.
  inline constexpr std::string_view LibraryLoggerName = "GroundLevel";

  /// @brief Gets or creates a logger with the specified name, inheriting global sink configuration.
  /// @param name The logger name.
  /// @return Shared pointer to the logger.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    auto log = spdlog::get(name);
    if (!log)
    {
      // Use default logger's sinks - inherits global configuration
      log = std::make_shared<spdlog::logger>(name, spdlog::default_logger()->sinks().begin(), spdlog::default_logger()->sinks().end());
      log->set_level(spdlog::default_logger()->level());
      try
      {
        spdlog::register_logger(log);
      }
      catch (const spdlog::spdlog_ex&)
      {
        // Another thread registered it first
        return spdlog::get(name);
      }
    }
    return log;
  }

  /// @brief Gets the library logger.
  ///
  /// The logger is resolved once and cached. It starts with the sinks and level of the default spdlog logger
  /// at the time of the first call. The logger is registered, so a later spdlog::set_level also applies to it.
  /// Changing only the default logger's level (spdlog::default_logger()->set_level) does not.
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = GetLogger(std::string(LibraryLoggerName));
    return logger;
  }
}

#endif
