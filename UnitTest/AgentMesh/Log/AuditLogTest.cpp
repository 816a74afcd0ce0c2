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
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <TestProviders.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace AgentMesh;
using namespace AgentMesh::Test;

namespace
{
  class ThrowingAuditSink final : public IAuditSink
  {
  public:
    void Record(const AuditEvent& /*event*/) override
    {
      throw std::runtime_error("disk full");
    }
  };

  AuditEvent MakeEvent(const AuditEventType type, const std::string& subject)
  {
    AuditEvent event;
    event.Type = type;
    event.Subject = subject;
    event.Detail = "unit";
    return event;
  }
}

TEST(AuditLogTest, ForwardsEventsWithTimestamp)
{
  auto sink = std::make_shared<RecordingAuditSink>();
  AuditLog auditLog(sink);
  const auto before = std::chrono::system_clock::now();

  auditLog.Record(MakeEvent(AuditEventType::CircuitBreakerReset, "tool"));

  const auto events = sink->GetEvents();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].Type, AuditEventType::CircuitBreakerReset);
  EXPECT_EQ(events[0].Subject, "tool");
  EXPECT_EQ(events[0].Detail, "unit");
  EXPECT_GE(events[0].Timestamp, before);
  EXPECT_EQ(auditLog.GetEventCount(), 1u);
}

TEST(AuditLogTest, KeepsAnExplicitTimestamp)
{
  auto sink = std::make_shared<RecordingAuditSink>();
  AuditLog auditLog(sink);
  auto event = MakeEvent(AuditEventType::CapabilityProhibited, "medical");
  event.Timestamp = std::chrono::system_clock::time_point(std::chrono::hours(5));

  auditLog.Record(event);

  ASSERT_EQ(sink->GetEvents().size(), 1u);
  EXPECT_EQ(sink->GetEvents()[0].Timestamp, event.Timestamp);
}

TEST(AuditLogTest, WorksWithoutSink)
{
  AuditLog auditLog;

  EXPECT_NO_THROW(auditLog.Record(MakeEvent(AuditEventType::CircuitBreakerReset, "all")));
  EXPECT_EQ(auditLog.GetEventCount(), 1u);
}

TEST(AuditLogTest, FailingSinkIsContained)
{
  AuditLog auditLog(std::make_shared<ThrowingAuditSink>());

  EXPECT_NO_THROW(auditLog.Record(MakeEvent(AuditEventType::CapabilityProhibited, "medical")));
  EXPECT_EQ(auditLog.GetEventCount(), 1u);
}

TEST(AuditLogTest, SetSinkReplacesTheSink)
{
  auto first = std::make_shared<RecordingAuditSink>();
  auto second = std::make_shared<RecordingAuditSink>();
  AuditLog auditLog(first);

  auditLog.Record(MakeEvent(AuditEventType::CircuitBreakerReset, "one"));
  auditLog.SetSink(second);
  auditLog.Record(MakeEvent(AuditEventType::CircuitBreakerReset, "two"));

  ASSERT_EQ(first->GetEvents().size(), 1u);
  ASSERT_EQ(second->GetEvents().size(), 1u);
  EXPECT_EQ(second->GetEvents()[0].Subject, "two");
}

TEST(AuditLogTest, EventTypeNames)
{
  EXPECT_EQ(ToString(AuditEventType::CircuitBreakerReset), "circuit_breaker_reset");
  EXPECT_EQ(ToString(AuditEventType::CapabilityProhibited), "capability_prohibited");
  EXPECT_EQ(ToString(AuditEventType::DeferralBroadcast), "deferral_broadcast");
  EXPECT_EQ(ToString(AuditEventType::ShutdownRequested), "shutdown_requested");
}

TEST(AuditLogTest, AuditLoggerIgnoresTheGlobalLevel)
{
  auto logger = Log::CreateAuditLogger("audit_level_test");
  const auto previous = spdlog::get_level();
  spdlog::set_level(spdlog::level::off);
  const auto level = logger->level();
  spdlog::set_level(previous);

  EXPECT_EQ(level, spdlog::level::trace);
  EXPECT_EQ(logger->flush_level(), spdlog::level::info);
  EXPECT_EQ(spdlog::get("audit_level_test"), nullptr);
}
