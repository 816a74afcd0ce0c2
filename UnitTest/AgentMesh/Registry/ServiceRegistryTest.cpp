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

#include <AgentMesh/Exception/DuplicateProviderRegistrationException.hpp>
#include <AgentMesh/Exception/InvalidProviderException.hpp>
#include <AgentMesh/Exception/ProviderCastException.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <gtest/gtest.h>
#include <TestProviders.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace AgentMesh;
using namespace AgentMesh::Test;

namespace
{
  std::vector<std::string> GetNames(const std::vector<ProviderRecord>& records)
  {
    std::vector<std::string> names;
    for (const auto& record : records)
    {
      names.push_back(record.Name);
    }
    return names;
  }

  ProviderQuery ToolQuery()
  {
    ProviderQuery query;
    query.Type = ServiceType::Tool;
    return query;
  }

  ProviderHandle RegisterLlm(ServiceRegistry& registry, const std::string& name, const std::string& domain,
                             const ServicePriority priority = ServicePriority::Normal)
  {
    ServiceRegistration registration;
    registration.Type = ServiceType::Llm;
    registration.Provider = std::make_shared<FakeLlmService>(name);
    registration.Priority = priority;
    if (!domain.empty())
    {
      registration.Metadata.emplace(std::string(MetadataKeys::Domain), domain);
    }
    return registry.Register(std::move(registration));
  }
}

TEST(ServiceRegistryTest, RegisterReturnsValidHandle)
{
  ServiceRegistry registry;

  const auto handle = RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"}));

  EXPECT_TRUE(handle.IsValid());
  EXPECT_EQ(handle.GetServiceType(), ServiceType::Tool);
  EXPECT_EQ(registry.GetProviderCount(), 1u);
  EXPECT_EQ(registry.GetProviderCount(ServiceType::Tool), 1u);
  EXPECT_EQ(registry.GetProviderCount(ServiceType::Llm), 0u);
  EXPECT_TRUE(registry.HasServiceType(ServiceType::Tool));
  EXPECT_FALSE(registry.HasServiceType(ServiceType::Llm));
}

TEST(ServiceRegistryTest, NameAndCapabilitiesDefaultToProvider)
{
  ServiceRegistry registry;

  const auto handle = RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"}));

  const auto record = registry.GetProvider(handle);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->Name, "calc");
  EXPECT_TRUE(record->HasCapability("execute_tool"));
  EXPECT_FALSE(record->HasCapability("call_llm"));
}

TEST(ServiceRegistryTest, RegistrationOverridesNameAndCapabilities)
{
  ServiceRegistry registry;
  ServiceRegistration registration;
  registration.Type = ServiceType::Tool;
  registration.Provider = std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"});
  registration.Name = "calculator";
  registration.Capabilities = {"math", "add"};

  const auto record = registry.GetProvider(registry.Register(std::move(registration)));

  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->Name, "calculator");
  EXPECT_TRUE(record->HasCapability("math"));
  EXPECT_FALSE(record->HasCapability("execute_tool"));
}

TEST(ServiceRegistryTest, DuplicateNameThrows)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"}));

  EXPECT_THROW(RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{"sub"})),
               DuplicateProviderRegistrationException);
  EXPECT_EQ(registry.GetProviderCount(), 1u);
}

TEST(ServiceRegistryTest, SameNameAllowedForDifferentTypes)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("shared", std::vector<std::string>{"add"}));

  EXPECT_NO_THROW(RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("shared")));
  EXPECT_EQ(registry.GetProviderCount(), 2u);
}

TEST(ServiceRegistryTest, NullProviderThrows)
{
  ServiceRegistry registry;

  EXPECT_THROW(RegisterProvider(registry, ServiceType::Tool, nullptr), InvalidProviderException);
}

TEST(ServiceRegistryTest, ProviderMustImplementTheServiceInterface)
{
  ServiceRegistry registry;

  EXPECT_THROW(RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeLlmService>("llm")), InvalidProviderException);
  EXPECT_THROW(RegisterProvider(registry, ServiceType::Communication, std::make_shared<PlainService>("plain")), InvalidProviderException);
  EXPECT_EQ(registry.GetProviderCount(), 0u);
}

TEST(ServiceRegistryTest, InvalidBreakerConfigThrows)
{
  ServiceRegistry registry;

  EXPECT_THROW(RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("llm"), ServicePriority::Normal, 0),
               InvalidProviderException);
}

TEST(ServiceRegistryTest, OrderedByPriority)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("low", std::vector<std::string>{}), ServicePriority::Low);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("critical", std::vector<std::string>{}), ServicePriority::Critical);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("fallback", std::vector<std::string>{}), ServicePriority::Fallback);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("normal", std::vector<std::string>{}), ServicePriority::Normal);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("high", std::vector<std::string>{}), ServicePriority::High);

  const auto names = GetNames(registry.GetProviders(ToolQuery()));

  EXPECT_EQ(names, (std::vector<std::string>{"critical", "high", "normal", "low", "fallback"}));
}

TEST(ServiceRegistryTest, PriorityGroupThenRegistrationOrder)
{
  ServiceRegistry registry;
  for (const auto& [name, group] : std::array<std::pair<const char*, uint32_t>, 4>{{{"g2", 2}, {"g1-first", 1}, {"g0", 0}, {"g1-second", 1}}})
  {
    ServiceRegistration registration;
    registration.Type = ServiceType::Tool;
    registration.Provider = std::make_shared<FakeToolService>(name, std::vector<std::string>{});
    registration.PriorityGroup = ServicePriorityGroup(group);
    registry.Register(std::move(registration));
  }

  const auto names = GetNames(registry.GetProviders(ToolQuery()));

  EXPECT_EQ(names, (std::vector<std::string>{"g0", "g1-first", "g1-second", "g2"}));
}

TEST(ServiceRegistryTest, CapabilityFilterRequiresEveryCapability)
{
  ServiceRegistry registry;
  for (const auto& [name, capabilities] :
       std::vector<std::pair<std::string, std::vector<std::string>>>{{"both", {"a", "b", "c"}}, {"only-a", {"a"}}, {"only-b", {"b"}}})
  {
    ServiceRegistration registration;
    registration.Type = ServiceType::Tool;
    registration.Provider = std::make_shared<FakeToolService>(name, std::vector<std::string>{});
    registration.Capabilities = capabilities;
    registry.Register(std::move(registration));
  }

  auto query = ToolQuery();
  query.RequiredCapabilities = {"a", "b"};
  EXPECT_EQ(GetNames(registry.GetProviders(query)), (std::vector<std::string>{"both"}));

  query.RequiredCapabilities = {"a"};
  EXPECT_EQ(GetNames(registry.GetProviders(query)), (std::vector<std::string>{"both", "only-a"}));

  query.RequiredCapabilities = {"missing"};
  EXPECT_TRUE(registry.GetProviders(query).empty());
}

TEST(ServiceRegistryTest, DomainFilterIsolatesAndPromotes)
{
  ServiceRegistry registry;
  RegisterLlm(registry, "general", "");
  RegisterLlm(registry, "explicit-general", "general");
  RegisterLlm(registry, "legal", "legal");
  RegisterLlm(registry, "finance", "finance");

  ProviderQuery query;
  query.Type = ServiceType::Llm;
  query.Domain = "legal";
  const auto records = registry.GetProviders(query);

  EXPECT_EQ(GetNames(records), (std::vector<std::string>{"legal", "general", "explicit-general"}));
  EXPECT_EQ(records.front().EffectivePriority, GetPriorityValue(ServicePriority::High));
  EXPECT_EQ(records.front().Priority, ServicePriority::Normal);
}

TEST(ServiceRegistryTest, NoDomainMeansEveryDomain)
{
  ServiceRegistry registry;
  RegisterLlm(registry, "general", "");
  RegisterLlm(registry, "finance", "finance");

  ProviderQuery query;
  query.Type = ServiceType::Llm;

  EXPECT_EQ(GetNames(registry.GetProviders(query)), (std::vector<std::string>{"general", "finance"}));
}

TEST(ServiceRegistryTest, OpenBreakerExcludedUntilRecovery)
{
  ManualClock clock;
  ServiceRegistry registry(nullptr, clock.GetFunction());
  const auto handle =
    RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("flaky", std::vector<std::string>{}), ServicePriority::Normal, 1);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("steady", std::vector<std::string>{}), ServicePriority::Low);

  registry.RecordFailure(handle);

  EXPECT_EQ(GetNames(registry.GetProviders(ToolQuery())), (std::vector<std::string>{"steady"}));
  EXPECT_FALSE(registry.TryAcquireProbe(handle));

  auto query = ToolQuery();
  query.IncludeUnavailable = true;
  const auto all = registry.GetProviders(query);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all.front().BreakerState, CircuitState::Open);

  clock.Advance(std::chrono::seconds(60));
  const auto recovered = registry.GetProviders(ToolQuery());
  ASSERT_EQ(recovered.size(), 2u);
  EXPECT_EQ(recovered.front().Name, "flaky");
  EXPECT_EQ(recovered.front().BreakerState, CircuitState::HalfOpen);
}

TEST(ServiceRegistryTest, LookupDoesNotCallTheProvider)
{
  ServiceRegistry registry;
  auto provider = std::make_shared<FakeToolService>("sick", std::vector<std::string>{});
  RegisterProvider(registry, ServiceType::Tool, provider);
  provider->SetHealthy(false);

  EXPECT_EQ(registry.GetProviders(ToolQuery()).size(), 1u);
  EXPECT_EQ(provider->GetHealthChecks(), 0u);

  const auto snapshot = FindSnapshot(registry, ServiceType::Tool, "sick");
  EXPECT_EQ(snapshot.Breaker.TotalFailures, 0u);
  EXPECT_EQ(snapshot.Metrics.FailedRequests, 0u);
}

TEST(ServiceRegistryTest, ReleaseProbeReturnsTheHalfOpenSlot)
{
  ManualClock clock;
  ServiceRegistry registry(nullptr, clock.GetFunction());
  ServiceRegistration registration;
  registration.Type = ServiceType::Tool;
  registration.Provider = std::make_shared<FakeToolService>("flaky", std::vector<std::string>{});
  registration.BreakerConfig.FailureThreshold = 1;
  registration.BreakerConfig.RecoveryTimeout = std::chrono::seconds(1);
  registration.BreakerConfig.MaxHalfOpenProbes = 1;
  const auto handle = registry.Register(std::move(registration));

  registry.RecordFailure(handle);
  clock.Advance(std::chrono::seconds(1));
  ASSERT_TRUE(registry.TryAcquireProbe(handle));
  EXPECT_FALSE(registry.TryAcquireProbe(handle));

  registry.ReleaseProbe(handle);

  EXPECT_TRUE(registry.TryAcquireProbe(handle));
  registry.ReleaseProbe(ProviderHandle(ServiceType::Tool, 9999));
}

TEST(ServiceRegistryTest, UnregisterRemovesProviderAndBreaker)
{
  ServiceRegistry registry;
  const auto handle =
    RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}), ServicePriority::Normal, 1);
  registry.RecordFailure(handle);

  EXPECT_TRUE(registry.Unregister(handle));
  EXPECT_FALSE(registry.Unregister(handle));
  EXPECT_FALSE(registry.GetProvider(handle).has_value());
  EXPECT_FALSE(registry.TryAcquireProbe(handle));
  // Stale handles are ignored
  registry.RecordFailure(handle);
  registry.RecordSuccess(handle, std::chrono::microseconds(10));

  const auto newHandle =
    RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}), ServicePriority::Normal, 1);
  EXPECT_NE(newHandle, handle);
  const auto record = registry.GetProvider(newHandle);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->BreakerState, CircuitState::Closed);
}

TEST(ServiceRegistryTest, UnregisterByName)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}));

  EXPECT_FALSE(registry.Unregister(ServiceType::Llm, "calc"));
  EXPECT_FALSE(registry.Unregister(ServiceType::Tool, "other"));
  EXPECT_TRUE(registry.Unregister(ServiceType::Tool, "calc"));
  EXPECT_EQ(registry.GetProviderCount(), 0u);
  EXPECT_FALSE(registry.HasServiceType(ServiceType::Tool));
}

TEST(ServiceRegistryTest, MetricsTrackLatencyAndFailures)
{
  ServiceRegistry registry;
  const auto handle = RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}));

  registry.RecordSuccess(handle, std::chrono::milliseconds(10));
  registry.RecordSuccess(handle, std::chrono::milliseconds(30));
  registry.RecordFailure(handle);

  const auto record = registry.GetProvider(handle);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->Metrics.TotalRequests, 3u);
  EXPECT_EQ(record->Metrics.FailedRequests, 1u);
  EXPECT_EQ(record->Metrics.ConsecutiveFailures, 1u);
  EXPECT_EQ(record->Metrics.LatencySamples, 2u);
  EXPECT_DOUBLE_EQ(record->Metrics.AverageLatencyMs, 20.0);
  EXPECT_TRUE(record->Metrics.LastFailureTime.has_value());
}

TEST(ServiceRegistryTest, ResetCircuitBreakersIsAudited)
{
  auto sink = std::make_shared<RecordingAuditSink>();
  ServiceRegistry registry(std::make_shared<AuditLog>(sink));
  const auto tool =
    RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}), ServicePriority::Normal, 1);
  const auto llm = RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("llm"), ServicePriority::Normal, 1);
  registry.RecordFailure(tool);
  registry.RecordFailure(llm);

  EXPECT_EQ(registry.ResetCircuitBreakers(ServiceType::Tool), 1u);
  EXPECT_EQ(registry.GetProvider(tool)->BreakerState, CircuitState::Closed);
  EXPECT_EQ(registry.GetProvider(llm)->BreakerState, CircuitState::Open);

  EXPECT_EQ(registry.ResetCircuitBreakers(), 2u);
  EXPECT_EQ(registry.GetProvider(llm)->BreakerState, CircuitState::Closed);

  const auto events = sink->GetEvents();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].Type, AuditEventType::CircuitBreakerReset);
  EXPECT_EQ(events[0].Subject, "tool");
  EXPECT_EQ(events[1].Subject, "all");
  EXPECT_EQ(registry.GetAuditLog()->GetEventCount(), 2u);
}

TEST(ServiceRegistryTest, SnapshotListsProvidersInRoutingOrder)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("b", std::vector<std::string>{}), ServicePriority::Low);
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("a", std::vector<std::string>{}), ServicePriority::High);
  RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("llm"));

  const auto snapshot = registry.Snapshot();
  EXPECT_EQ(snapshot.GetProviderCount(), 3u);
  const auto& tools = snapshot.Providers.at(ServiceType::Tool);
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0].Name, "a");
  EXPECT_EQ(tools[1].Name, "b");
  EXPECT_EQ(tools[0].Breaker.State, CircuitState::Closed);

  EXPECT_EQ(registry.Snapshot(ServiceType::Llm).GetProviderCount(), 1u);
}

TEST(ServiceRegistryTest, GetInstanceChecksTheInterface)
{
  ServiceRegistry registry;
  const auto handle = RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"}));
  const auto record = registry.GetProvider(handle);
  ASSERT_TRUE(record.has_value());

  EXPECT_NE(record->GetInstance<IToolService>(), nullptr);
  EXPECT_THROW(record->GetInstance<ILlmService>(), ProviderCastException);
}

TEST(ServiceRegistryTest, WaitReadyTimesOut)
{
  ServiceRegistry registry;
  const std::array<ServiceType, 1> required{ServiceType::Llm};

  EXPECT_FALSE(registry.WaitReady(required, std::chrono::milliseconds(20)));
}

TEST(ServiceRegistryTest, WaitReadyReturnsOnceEveryTypeIsRegistered)
{
  ServiceRegistry registry;
  const std::array<ServiceType, 2> required{ServiceType::Llm, ServiceType::Tool};
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}));

  std::thread registrar(
    [&registry]()
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("llm"));
    });

  EXPECT_TRUE(registry.WaitReady(required, std::chrono::seconds(5)));
  registrar.join();
}

TEST(ServiceRegistryTest, ClearRemovesEverything)
{
  ServiceRegistry registry;
  RegisterProvider(registry, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}));
  RegisterProvider(registry, ServiceType::Llm, std::make_shared<FakeLlmService>("llm"));

  registry.Clear();

  EXPECT_EQ(registry.GetProviderCount(), 0u);
  EXPECT_TRUE(registry.Snapshot().Providers.empty());
}

TEST(ServiceRegistryTest, ConcurrentRegistrationAndQueries)
{
  ServiceRegistry registry;
  constexpr int ThreadCount = 4;
  constexpr int PerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < ThreadCount; ++t)
  {
    threads.emplace_back(
      [&registry, t]()
      {
        for (int i = 0; i < PerThread; ++i)
        {
          const auto handle = RegisterProvider(registry, ServiceType::Tool,
                                               std::make_shared<FakeToolService>(fmt::format("tool-{}-{}", t, i), std::vector<std::string>{}));
          registry.RecordSuccess(handle, std::chrono::microseconds(100));
          EXPECT_FALSE(registry.GetProviders(ToolQuery()).empty());
        }
      });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_EQ(registry.GetProviderCount(ServiceType::Tool), static_cast<std::size_t>(ThreadCount * PerThread));
}

TEST(ServiceRegistryTest, IndependentRegistries)
{
  ServiceRegistry first;
  ServiceRegistry second;
  RegisterProvider(first, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{}));

  EXPECT_EQ(first.GetProviderCount(), 1u);
  EXPECT_EQ(second.GetProviderCount(), 0u);
  EXPECT_NO_THROW(RegisterProvider(second, ServiceType::Tool, std::make_shared<FakeToolService>("calc", std::vector<std::string>{})));
}
