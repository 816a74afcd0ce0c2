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

#include <AgentMesh/Bus/WiseBus.hpp>
#include <AgentMesh/Exception/BusStoppedException.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <TestProviders.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace AgentMesh;
using namespace AgentMesh::Test;

namespace
{
  WiseBusConfig MakeWiseConfig()
  {
    WiseBusConfig config;
    config.GuidanceTimeout = std::chrono::milliseconds(500);
    config.DeferralTimeout = std::chrono::milliseconds(500);
    config.MaxGuidanceFanOut = 3;
    return config;
  }

  GuidanceRequest MakeRequest(const std::optional<std::string>& capability = std::nullopt)
  {
    GuidanceRequest request;
    request.Context = "Should the agent reply to the user?";
    request.Options = {"reply", "wait"};
    request.Capability = capability;
    return request;
  }

  DeferralContext MakeDeferral(const std::string& thoughtId)
  {
    DeferralContext context;
    context.ThoughtId = thoughtId;
    context.TaskId = "task-1";
    context.Reason = "needs a human";
    return context;
  }

  class WiseBusTest : public ::testing::Test
  {
  protected:
    ServiceRegistry m_registry;
    ProviderInvoker m_invoker;
    WiseBus m_bus{m_registry, m_invoker, MakeWiseConfig()};

    void SetUp() override
    {
      m_bus.Start();
    }

    std::shared_ptr<FakeWiseAuthority> Add(const std::string& name, const std::optional<double> confidence,
                                           std::vector<std::string> extraCapabilities = {},
                                           const ServicePriority priority = ServicePriority::Normal)
    {
      auto authority = std::make_shared<FakeWiseAuthority>(name, confidence, std::move(extraCapabilities));
      RegisterProvider(m_registry, ServiceType::WiseAuthority, authority, priority);
      return authority;
    }
  };
}

TEST_F(WiseBusTest, GuidanceSelectsTheMostConfidentAnswer)
{
  Add("a", 0.4);
  Add("b", 0.9);
  Add("c", 0.6);

  const auto response = m_bus.RequestGuidance(MakeRequest());

  EXPECT_FALSE(response.Degraded);
  EXPECT_EQ(response.WaId, "b");
  EXPECT_EQ(response.Reasoning, "b reasoning (selected with 0.90 confidence from 3 providers)");
  EXPECT_EQ(response.SelectedOption, std::optional<std::string>("reply"));
  EXPECT_EQ(response.Advice.size(), 3u);
}

TEST_F(WiseBusTest, HangingAuthorityIsIgnoredAndCountedAsFailure)
{
  auto sleepy = Add("sleepy", 0.99);
  sleepy->SetBehavior(FakeBehavior::Hang);
  Add("awake", 0.5);

  const auto start = SteadyClock::now();
  const auto response = m_bus.RequestGuidance(MakeRequest());

  EXPECT_LT(SteadyClock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(response.WaId, "awake");
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::WiseAuthority, "sleepy").Breaker.TotalFailures, 1u);
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::WiseAuthority, "awake").Breaker.TotalFailures, 0u);
}

TEST_F(WiseBusTest, ExplicitTimeoutOverridesTheDefault)
{
  Add("sleepy", 0.9)->SetBehavior(FakeBehavior::Hang);

  const auto start = SteadyClock::now();
  const auto response = m_bus.RequestGuidance(MakeRequest(), std::chrono::milliseconds(50));

  EXPECT_LT(SteadyClock::now() - start, std::chrono::milliseconds(450));
  EXPECT_TRUE(response.Degraded);
}

TEST_F(WiseBusTest, NoProvidersGivesDegradedResponse)
{
  const auto response = m_bus.RequestGuidance(MakeRequest());

  EXPECT_TRUE(response.Degraded);
  EXPECT_EQ(response.CustomGuidance, std::optional<std::string>("No providers available"));
  EXPECT_EQ(m_bus.GetStats().Metrics.at("degraded_responses"), 1.0);
}

TEST_F(WiseBusTest, SilentAuthoritiesGiveDegradedResponse)
{
  Add("quiet", 0.5)->SetBehavior(FakeBehavior::Fail);
  Add("broken", 0.5)->SetBehavior(FakeBehavior::Throw);

  const auto response = m_bus.RequestGuidance(MakeRequest());

  EXPECT_TRUE(response.Degraded);
  EXPECT_EQ(response.CustomGuidance, std::optional<std::string>("No providers responded"));
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::WiseAuthority, "broken").Breaker.TotalFailures, 1u);
}

TEST_F(WiseBusTest, CapabilityFiltersAuthorities)
{
  auto ethicist = Add("ethicist", 0.3, {"ethics"});
  auto generalist = Add("generalist", 0.9);

  const auto response = m_bus.RequestGuidance(MakeRequest(std::string("ethics")));

  EXPECT_EQ(response.WaId, "ethicist");
  EXPECT_EQ(ethicist->GetGuidanceCalls(), 1u);
  EXPECT_EQ(generalist->GetGuidanceCalls(), 0u);
}

TEST_F(WiseBusTest, FanOutIsCapped)
{
  std::vector<std::shared_ptr<FakeWiseAuthority>> authorities;
  for (int i = 0; i < 5; ++i)
  {
    authorities.push_back(Add(fmt::format("wa{}", i), 0.1 * (i + 1)));
  }

  const auto response = m_bus.RequestGuidance(MakeRequest());

  uint32_t calls = 0;
  for (const auto& authority : authorities)
  {
    calls += authority->GetGuidanceCalls();
  }
  EXPECT_EQ(calls, 3u);
  EXPECT_EQ(authorities[3]->GetGuidanceCalls(), 0u);
  EXPECT_EQ(authorities[4]->GetGuidanceCalls(), 0u);
  EXPECT_EQ(response.WaId, "wa2");
}

TEST_F(WiseBusTest, DeferralIsBroadcastToEveryAuthority)
{
  auto first = Add("first", std::nullopt);
  auto second = Add("second", std::nullopt);
  auto context = MakeDeferral("thought-1");
  context.Priority = "high";
  context.Metadata.emplace("origin", "unit");

  const auto before = std::chrono::system_clock::now();
  EXPECT_TRUE(m_bus.SendDeferral(context, "handler"));

  ASSERT_EQ(first->GetDeferrals().size(), 1u);
  ASSERT_EQ(second->GetDeferrals().size(), 1u);
  const auto delivered = first->GetDeferrals().front();
  EXPECT_EQ(delivered.ThoughtId, "thought-1");
  EXPECT_EQ(delivered.TaskId, "task-1");
  EXPECT_EQ(delivered.Reason, "needs a human");
  EXPECT_EQ(delivered.Context.at("priority"), "high");
  EXPECT_EQ(delivered.Context.at("origin"), "unit");
  EXPECT_GE(delivered.DeferUntil, before + std::chrono::minutes(59));
  EXPECT_LE(delivered.DeferUntil, std::chrono::system_clock::now() + std::chrono::hours(1));
  EXPECT_EQ(m_bus.GetStats().Metrics.at("deferrals_sent"), 1.0);
}

TEST_F(WiseBusTest, ExplicitDeferUntilIsKept)
{
  auto authority = Add("wa", std::nullopt);
  auto context = MakeDeferral("thought-2");
  const auto until = std::chrono::system_clock::now() + std::chrono::hours(24);
  context.DeferUntil = until;

  EXPECT_TRUE(m_bus.SendDeferral(context, "handler"));
  ASSERT_EQ(authority->GetDeferrals().size(), 1u);
  EXPECT_EQ(authority->GetDeferrals().front().DeferUntil, until);
}

TEST_F(WiseBusTest, DeferralNeedsOneAcknowledgement)
{
  Add("refuses", std::nullopt)->SetAcknowledge(false);
  EXPECT_FALSE(m_bus.SendDeferral(MakeDeferral("thought-3"), "handler"));

  Add("accepts", std::nullopt);
  EXPECT_TRUE(m_bus.SendDeferral(MakeDeferral("thought-4"), "handler"));

  const auto metrics = m_bus.GetStats().Metrics;
  EXPECT_EQ(metrics.at("deferrals_sent"), 1.0);
  EXPECT_EQ(metrics.at("deferrals_undelivered"), 1.0);
}

TEST_F(WiseBusTest, DeferralBroadcastIsAudited)
{
  auto sink = std::make_shared<RecordingAuditSink>();
  m_registry.GetAuditLog()->SetSink(sink);
  Add("accepts", std::nullopt);
  Add("refuses", std::nullopt)->SetAcknowledge(false);

  EXPECT_TRUE(m_bus.SendDeferral(MakeDeferral("thought-9"), "handler"));

  const auto events = sink->GetEvents();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].Type, AuditEventType::DeferralBroadcast);
  EXPECT_EQ(events[0].Subject, "thought-9");
  EXPECT_EQ(events[0].Detail, "task='task-1' handler='handler' acknowledged=1/2 reason='needs a human'");
}

TEST_F(WiseBusTest, DeferralWithoutAuthoritiesIsUndelivered)
{
  EXPECT_FALSE(m_bus.SendDeferral(MakeDeferral("thought-5"), "handler"));
  EXPECT_EQ(m_bus.GetStats().Metrics.at("deferrals_undelivered"), 1.0);
}

TEST_F(WiseBusTest, RequestReviewIsSentAsDeferral)
{
  auto authority = Add("reviewer", std::nullopt);
  const std::map<std::string, std::string> reviewData{{"item", "42"}};

  EXPECT_TRUE(m_bus.RequestReview("identity_variance", reviewData, "audit_handler"));

  ASSERT_EQ(authority->GetDeferrals().size(), 1u);
  const auto delivered = authority->GetDeferrals().front();
  EXPECT_EQ(delivered.ThoughtId, "review_identity_variance_audit_handler");
  EXPECT_EQ(delivered.TaskId, "review_task_identity_variance");
  EXPECT_EQ(delivered.Reason, "Review requested: identity_variance");
  EXPECT_EQ(delivered.Context.at("item"), "42");
  EXPECT_EQ(delivered.Context.at("handler_name"), "audit_handler");
}

TEST_F(WiseBusTest, SubmittedDeferralsAreProcessedByTheConsumer)
{
  auto authority = Add("wa", std::nullopt);

  EXPECT_TRUE(m_bus.SubmitDeferral(MakeDeferral("queued-1"), "handler"));
  EXPECT_TRUE(m_bus.SubmitDeferral(MakeDeferral("queued-2"), "handler"));
  ASSERT_TRUE(m_bus.Stop());

  const auto deferrals = authority->GetDeferrals();
  ASSERT_EQ(deferrals.size(), 2u);
  EXPECT_EQ(deferrals[0].ThoughtId, "queued-1");
  EXPECT_EQ(deferrals[1].ThoughtId, "queued-2");
  EXPECT_EQ(m_bus.GetStats().Processed, 2u);
}

TEST_F(WiseBusTest, UnacknowledgedSubmittedDeferralCountsAsFailed)
{
  Add("refuses", std::nullopt)->SetAcknowledge(false);

  EXPECT_TRUE(m_bus.SubmitDeferral(MakeDeferral("queued"), "handler"));
  ASSERT_TRUE(m_bus.Stop());

  const auto stats = m_bus.GetStats();
  EXPECT_EQ(stats.Processed, 0u);
  EXPECT_EQ(stats.Failed, 1u);
}

TEST_F(WiseBusTest, FetchGuidanceUsesTheBestAuthority)
{
  Add("junior", std::nullopt, {}, ServicePriority::Low);
  Add("senior", std::nullopt, {}, ServicePriority::High);
  GuidanceContext context;
  context.Question = "the refund";

  EXPECT_EQ(m_bus.FetchGuidance(context, "handler"), std::optional<std::string>("senior says: proceed with the refund"));
}

TEST_F(WiseBusTest, FetchGuidanceFallsBackAndReturnsNulloptWhenAllFail)
{
  auto senior = Add("senior", std::nullopt, {}, ServicePriority::High);
  auto junior = Add("junior", std::nullopt, {}, ServicePriority::Low);
  senior->SetBehavior(FakeBehavior::Throw);
  GuidanceContext context;
  context.Question = "it";

  EXPECT_EQ(m_bus.FetchGuidance(context, "handler"), std::optional<std::string>("junior says: proceed with it"));

  junior->SetBehavior(FakeBehavior::Throw);
  EXPECT_FALSE(m_bus.FetchGuidance(context, "handler").has_value());
}

TEST_F(WiseBusTest, StoppedBusRejectsSynchronousCalls)
{
  m_bus.Stop();

  EXPECT_THROW(m_bus.RequestGuidance(MakeRequest()), BusStoppedException);
  EXPECT_THROW(m_bus.SendDeferral(MakeDeferral("late"), "handler"), BusStoppedException);
  EXPECT_FALSE(m_bus.SubmitDeferral(MakeDeferral("late"), "handler"));
}

TEST_F(WiseBusTest, GuidanceMetrics)
{
  Add("wa", 0.5);

  m_bus.RequestGuidance(MakeRequest());
  m_bus.RequestGuidance(MakeRequest(std::string("unknown_capability")));

  const auto metrics = m_bus.GetStats().Metrics;
  EXPECT_EQ(metrics.at("guidance_requests"), 2.0);
  EXPECT_EQ(metrics.at("degraded_responses"), 1.0);
  EXPECT_EQ(metrics.at("prohibited_rejections"), 0.0);
}
