#ifndef AGENTMESH_LOG_LOGHELPER_HPP
#define AGENTMESH_LOG_LOGHELPER_HPP
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

namespace AgentMesh::Log
{
  /// @brief Gets or creates a named logger that shares the sinks of the default logger.
  /// @tparam Name A tag type created with AGENTMESH_LOGGER_NAME.
  /// @return Shared pointer to the logger.
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = []()
    {
      constexpr std::string_view name = Name::value;
      auto log = spdlog::get(std::string(name));
      if (!log)
      {
        log = std::make_shared<spdlog::logger>(std::string(name), spdlog::default_logger()->sinks().begin(),
                                               spdlog::default_logger()->sinks().end());
        log->set_level(spdlog::default_logger()->level());
        spdlog::register_logger(log);
      }
      return log;
    }();
    return logger;
  }

  /// @brief Gets or creates a named logger that shares the sinks of the default logger.
  /// @param name The logger name.
  /// @return Shared pointer to the logger.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    auto log = spdlog::get(name);
    if (!log)
    {
      log = std::make_shared<spdlog::logger>(name, spdlog::default_logger()->sinks().begin(),
                                             spdlog::default_logger()->sinks().end());
      log->set_level(spdlog::default_logger()->level());
      spdlog::register_logger(log);
    }
    return log;
  }

  /// @brief Creates the logger that audit records are written to.
  ///
  /// It shares the sinks of the default logger but is not registered, so spdlog::set_level and
  /// spdlog::drop_all leave it alone. It logs every level and flushes on info, as an audit record
  /// must not sit in a buffer when the process dies.
  inline std::shared_ptr<spdlog::logger> CreateAuditLogger(const std::string& name = "audit")
  {
    auto log = std::make_shared<spdlog::logger>(name, spdlog::default_logger()->sinks().begin(),
                                             spdlog::default_logger()->sinks().end());
    log->set_level(spdlog::level::trace);
    log->flush_on(spdlog::level::info);
    return log;
  }
}

// Defines a compile-time logger name tag
#define AGENTMESH_LOGGER_NAME(name)                  \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
