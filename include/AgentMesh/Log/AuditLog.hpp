#ifndef AGENTMESH_LOG_AUDITLOG_HPP
#define AGENTMESH_LOG_AUDITLOG_HPP
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

#include <spdlog/logger.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace AgentMesh
{
  enum class AuditEventType : uint8_t
  {
    CircuitBreakerReset,
    CapabilityProhibited,
    DeferralBroadcast,
    ShutdownRequested,
  };

  std::string_view ToString(AuditEventType type) noexcept;

  /// @brief A single security relevant event.
  struct AuditEvent
  {
    AuditEventType Type{AuditEventType::CircuitBreakerReset};
    /// @brief What the event applies to (a service type, a capability string, ...).
    std::string Subject;
    std::string Detail;
    std::chrono::system_clock::time_point Timestamp{};
  };

  /// @brief External collaborator that persists audit events.
  class IAuditSink
  {
  public:
    virtual ~IAuditSink() = default;

    virtual void Record(const AuditEvent& event) = 0;
  };

  /// @brief Writes audit events to a dedicated logger and forwards them to an optional sink.
  ///
  /// The audit logger comes from Log::CreateAuditLogger, so global level changes can not silence it.
  class AuditLog
  {
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IAuditSink> m_sink;
    mutable std::mutex m_mutex;
    uint64_t m_eventCount{0};

  public:
    explicit AuditLog(std::shared_ptr<IAuditSink> sink = nullptr);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void SetSink(std::shared_ptr<IAuditSink> sink);

    void Record(AuditEvent event);

    [[nodiscard]] uint64_t GetEventCount() const;
  };
}

#endif
