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

#include <AgentMesh/Bus/LlmBus.hpp>
#include <AgentMesh/Exception/BusStoppedException.hpp>
#include <AgentMesh/Exception/OperationFailedException.hpp>
#include <AgentMesh/Exception/ProviderUnavailableException.hpp>
#include <gtest/gtest.h>
#include <TestProviders.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace AgentMesh;
using namespace AgentMesh::Test;

namespace
{
  LlmBusConfig MakeLlmConfig()
  {
    LlmBusConfig config;
    config.CallTimeout = std::chrono::milliseconds(200);
    return config;
  }

  LlmRequest MakeRequest(const std::optional<std::string>& domain = std::nullopt)
  {
    LlmRequest request;
    request.Messages.push_back(LlmMessage{"user", "hello"});
    request.Domain = domain;
    return request;
  }

  class LlmBusTest : public ::testing::Test
  {
  protected:
    ManualClock m_clock;
    ServiceRegistry m_registry{nullptr, m_clock.GetFunction()};
    ProviderInvoker m_invoker;
    LlmBus m_bus{m_registry, m_invoker, MakeLlmConfig()};

    void SetUp() override
    {
      m_bus.Start();
    }

    ProviderHandle Add(const std::shared_ptr<FakeLlmService>& provider, const ServicePriority priority = ServicePriority::Normal,
                       const std::optional<std::string>& domain = std::nullopt)
    {
      ServiceRegistration registration;
      registration.Type = ServiceType::Llm;
      registration.Provider = provider;
      registration.Priority = priority;
      if (domain.has_value())
      {
        registration.Metadata.emplace(std::string(MetadataKeys::Domain), *domain);
      }
      return m_registry.Register(std::move(registration));
    }
  };
}

TEST_F(LlmBusTest, AnswersAndFillsTheProviderName)
{
  Add(std::make_shared<FakeLlmService>("gpt"));

  const auto result = m_bus.CallLlm(MakeRequest(), "handler");

  EXPECT_EQ(result.ProviderName, "gpt");
  EXPECT_EQ(result.Content, "gpt answered 1 message(s)");
  EXPECT_EQ(result.Model, "test-model");
  EXPECT_EQ(result.Usage.OutputTokens, 20u);
}

TEST_F(LlmBusTest, DomainRoutingPromotesExactMatchAndExcludesOtherDomains)
{
  auto general = std::make_shared<FakeLlmService>("G");
  auto legal = std::make_shared<FakeLlmService>("L");
  auto finance = std::make_shared<FakeLlmService>("F");
  Add(general, ServicePriority::Normal, std::string("general"));
  Add(legal, ServicePriority::Normal, std::string("legal"));
  Add(finance, ServicePriority::High, std::string("finance"));

  EXPECT_EQ(m_bus.CallLlm(MakeRequest(std::string("legal")), "handler").ProviderName, "L");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(std::string("finance")), "handler").ProviderName, "F");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(std::string("medical")), "handler").ProviderName, "G");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "F");
}

TEST_F(LlmBusTest, DomainWithoutEligibleProviderIsUnavailable)
{
  auto finance = std::make_shared<FakeLlmService>("F");
  Add(finance, ServicePriority::High, std::string("finance"));

  EXPECT_THROW(m_bus.CallLlm(MakeRequest(std::string("legal")), "handler"), ProviderUnavailableException);
  EXPECT_EQ(finance->GetCalls(), 0u);
  EXPECT_EQ(m_bus.GetStats().Metrics.at("llm_failed_requests"), 1.0);
}

TEST_F(LlmBusTest, NoProvidersIsUnavailable)
{
  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), ProviderUnavailableException);
}

TEST_F(LlmBusTest, PrefersTheFastestProvider)
{
  auto slow = std::make_shared<FakeLlmService>("slow", std::vector<std::string>{"m"}, std::chrono::milliseconds(50));
  auto fast = std::make_shared<FakeLlmService>("fast", std::vector<std::string>{"m"}, std::chrono::milliseconds(5));
  Add(slow);
  Add(fast);

  // Unmeasured providers are tried first, in registration order
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "slow");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "fast");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "fast");
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "fast");
  EXPECT_EQ(slow->GetCalls(), 1u);
}

TEST_F(LlmBusTest, FailsOverToLowerPriority)
{
  auto primary = std::make_shared<FakeLlmService>("primary");
  auto secondary = std::make_shared<FakeLlmService>("secondary");
  primary->SetBehavior(FakeBehavior::Throw);
  Add(primary, ServicePriority::High);
  Add(secondary, ServicePriority::Normal);

  const auto result = m_bus.CallLlm(MakeRequest(), "handler");

  EXPECT_EQ(result.ProviderName, "secondary");
  const auto stats = m_bus.GetServiceStats();
  EXPECT_EQ(stats.at("primary").FailedRequests, 1u);
  EXPECT_EQ(stats.at("secondary").TotalRequests, 1u);
  EXPECT_EQ(stats.at("secondary").TotalOutputTokens, 20u);
  EXPECT_DOUBLE_EQ(stats.at("secondary").TotalCostCents, 0.5);
}

TEST_F(LlmBusTest, AllProvidersFailing)
{
  auto one = std::make_shared<FakeLlmService>("one");
  auto two = std::make_shared<FakeLlmService>("two");
  one->SetBehavior(FakeBehavior::Fail);
  two->SetBehavior(FakeBehavior::Throw);
  Add(one, ServicePriority::High);
  Add(two, ServicePriority::Low);

  try
  {
    m_bus.CallLlm(MakeRequest(), "handler");
    FAIL() << "expected every provider to fail";
  }
  catch (const OperationFailedException& ex)
  {
    EXPECT_TRUE(std::string(ex.what()).starts_with("All LLM services failed ("));
    ASSERT_EQ(ex.GetFailures().size(), 2u);
    EXPECT_EQ(ex.GetFailures()[0].ProviderName, "one");
    EXPECT_EQ(ex.GetFailures()[1].ProviderName, "two");
  }

  const auto metrics = m_bus.GetStats().Metrics;
  EXPECT_EQ(metrics.at("llm_requests"), 1.0);
  EXPECT_EQ(metrics.at("llm_failed_requests"), 1.0);
}

TEST_F(LlmBusTest, TimeoutIsExactlyOneFailure)
{
  auto sleepy = std::make_shared<FakeLlmService>("sleepy");
  sleepy->SetBehavior(FakeBehavior::Hang);
  Add(sleepy);

  try
  {
    m_bus.CallLlm(MakeRequest(), "handler");
    FAIL() << "expected a timeout";
  }
  catch (const OperationFailedException& ex)
  {
    ASSERT_EQ(ex.GetFailures().size(), 1u);
    EXPECT_TRUE(ex.GetFailures()[0].TimedOut);
  }

  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::Llm, "sleepy").Breaker.TotalFailures, 1u);
  EXPECT_EQ(m_bus.GetServiceStats().at("sleepy").FailedRequests, 1u);
}

TEST_F(LlmBusTest, RateLimitedProviderCoolsDownWithoutBreakerFailure)
{
  auto limited = std::make_shared<FakeLlmService>("limited");
  auto backup = std::make_shared<FakeLlmService>("backup");
  limited->SetBehavior(FakeBehavior::RateLimit);
  limited->SetRetryAfter(std::chrono::seconds(10));
  const auto handle = Add(limited, ServicePriority::High);
  Add(backup, ServicePriority::Normal);

  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "backup");
  EXPECT_TRUE(m_bus.IsInCooldown(handle));
  EXPECT_EQ(m_bus.GetStats().Metrics.at("providers_in_cooldown"), 1.0);

  const auto snapshot = FindSnapshot(m_registry, ServiceType::Llm, "limited");
  EXPECT_EQ(snapshot.Breaker.TotalFailures, 0u);
  EXPECT_EQ(snapshot.Breaker.State, CircuitState::Closed);
  const auto stats = m_bus.GetServiceStats().at("limited");
  EXPECT_EQ(stats.RateLimitedRequests, 1u);
  ASSERT_TRUE(stats.CooldownUntil.has_value());
  EXPECT_EQ(*stats.CooldownUntil, m_clock.Now() + std::chrono::seconds(10));

  // Skipped while cooling down
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "backup");
  EXPECT_EQ(limited->GetCalls(), 1u);

  m_clock.Advance(std::chrono::seconds(10));
  EXPECT_FALSE(m_bus.IsInCooldown(handle));
  limited->SetBehavior(FakeBehavior::Succeed);
  EXPECT_EQ(m_bus.CallLlm(MakeRequest(), "handler").ProviderName, "limited");
  EXPECT_FALSE(m_bus.GetServiceStats().at("limited").CooldownUntil.has_value());
}

TEST_F(LlmBusTest, RateLimitWithoutHintUsesConfiguredCooldown)
{
  auto limited = std::make_shared<FakeLlmService>("limited");
  limited->SetBehavior(FakeBehavior::RateLimit);
  const auto handle = Add(limited);

  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), OperationFailedException);

  m_clock.Advance(std::chrono::seconds(59));
  EXPECT_TRUE(m_bus.IsInCooldown(handle));
  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), ProviderUnavailableException);

  m_clock.Advance(std::chrono::seconds(1));
  EXPECT_FALSE(m_bus.IsInCooldown(handle));
}

TEST_F(LlmBusTest, RateLimitedTrialCallGivesBackTheHalfOpenSlot)
{
  auto provider = std::make_shared<FakeLlmService>("gpt");
  ServiceRegistration registration;
  registration.Type = ServiceType::Llm;
  registration.Provider = provider;
  registration.BreakerConfig.FailureThreshold = 1;
  registration.BreakerConfig.SuccessThreshold = 1;
  registration.BreakerConfig.RecoveryTimeout = std::chrono::seconds(1);
  registration.BreakerConfig.MaxHalfOpenProbes = 1;
  m_registry.Register(std::move(registration));

  provider->SetBehavior(FakeBehavior::Throw);
  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), OperationFailedException);
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::Llm, "gpt").Breaker.State, CircuitState::Open);

  m_clock.Advance(std::chrono::milliseconds(1500));
  provider->SetBehavior(FakeBehavior::RateLimit);
  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), OperationFailedException);
  const auto limited = FindSnapshot(m_registry, ServiceType::Llm, "gpt").Breaker;
  EXPECT_EQ(limited.State, CircuitState::HalfOpen);
  EXPECT_EQ(limited.ActiveProbes, 0u);

  m_clock.Advance(std::chrono::hours(1));
  provider->SetBehavior(FakeBehavior::Succeed);
  const auto result = m_bus.CallLlm(MakeRequest(), "handler");
  EXPECT_EQ(result.ProviderName, "gpt");
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::Llm, "gpt").Breaker.State, CircuitState::Closed);
  EXPECT_EQ(provider->GetCalls(), 3u);
}

TEST_F(LlmBusTest, ModelListingLeavesUnhealthyBreakersAlone)
{
  auto provider = std::make_shared<FakeLlmService>("gpt");
  Add(provider);
  provider->SetHealthy(false);

  EXPECT_TRUE(m_bus.GetAvailableModels().empty());
  EXPECT_TRUE(m_bus.GetAvailableModels().empty());

  EXPECT_EQ(provider->GetHealthChecks(), 2u);
  EXPECT_EQ(FindSnapshot(m_registry, ServiceType::Llm, "gpt").Breaker.TotalFailures, 0u);
}

TEST_F(LlmBusTest, AvailableModelsAreTheSortedUnion)
{
  Add(std::make_shared<FakeLlmService>("one", std::vector<std::string>{"zeta", "alpha"}));
  Add(std::make_shared<FakeLlmService>("two", std::vector<std::string>{"alpha", "mid"}));

  EXPECT_EQ(m_bus.GetAvailableModels(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
}

TEST_F(LlmBusTest, StoppedBusRejectsCalls)
{
  Add(std::make_shared<FakeLlmService>("gpt"));
  m_bus.Stop();

  EXPECT_THROW(m_bus.CallLlm(MakeRequest(), "handler"), BusStoppedException);
}
