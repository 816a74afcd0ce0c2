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

#include <AgentMesh/Log/AuditLog.hpp>
#include <AgentMesh/Log/LogHelper.hpp>
#include <exception>
#include <utility>

namespace AgentMesh
{
  std::string_view ToString(const AuditEventType type) noexcept
  {
    switch (type)
    {
    case AuditEventType::CircuitBreakerReset:
      return "circuit_breaker_reset";
    case AuditEventType::CapabilityProhibited:
      return "capability_prohibited";
    case AuditEventType::DeferralBroadcast:
      return "deferral_broadcast";
    case AuditEventType::ShutdownRequested:
      return "shutdown_requested";
    }
    return "unknown";
  }

  AuditLog::AuditLog(std::shared_ptr<IAuditSink> sink)
    : m_logger(Log::CreateAuditLogger())
    , m_sink(std::move(sink))
  {
  }

  void AuditLog::SetSink(std::shared_ptr<IAuditSink> sink)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
  }

  void AuditLog::Record(AuditEvent event)
  {
    if (event.Timestamp == std::chrono::system_clock::time_point{})
    {
      event.Timestamp = std::chrono::system_clock::now();
    }

    std::shared_ptr<IAuditSink> sink;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      ++m_eventCount;
      sink = m_sink;
    }

    m_logger->info("AUDIT {} subject='{}' {}", ToString(event.Type), event.Subject, event.Detail);

    if (sink)
    {
      try
      {
        sink->Record(event);
      }
      catch (const std::exception& ex)
      {
        m_logger->error("AuditLog::Record: audit sink failed: {}", ex.what());
      }
    }
  }

  uint64_t AuditLog::GetEventCount() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_eventCount;
  }
}
