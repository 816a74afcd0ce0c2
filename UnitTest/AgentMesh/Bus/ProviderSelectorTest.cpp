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

#include <AgentMesh/Bus/ProviderSelector.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace AgentMesh;

namespace
{
  ProviderRecord MakeRecord(const std::string& name, const ServicePriority priority, const uint64_t registrationOrder,
                            const SelectionStrategy strategy = SelectionStrategy::Fallback, const uint32_t group = 0,
                            const std::optional<double> latencyMs = std::nullopt)
  {
    ProviderRecord record;
    record.Handle = ProviderHandle(ServiceType::Tool, registrationOrder + 1);
    record.Name = name;
    record.Priority = priority;
    record.EffectivePriority = GetPriorityValue(priority);
    record.PriorityGroup = ServicePriorityGroup(group);
    record.Strategy = strategy;
    record.RegistrationOrder = registrationOrder;
    if (latencyMs.has_value())
    {
      record.Metrics.AverageLatencyMs = *latencyMs;
      record.Metrics.LatencySamples = 1;
    }
    return record;
  }

  std::vector<std::string> GetMemberNames(const SelectionGroup& group)
  {
    std::vector<std::string> names;
    for (const auto& member : group.Members)
    {
      names.push_back(member.Name);
    }
    return names;
  }
}

TEST(ProviderSelectorTest, EmptyInputGivesEmptyPlan)
{
  ProviderSelector selector;

  EXPECT_TRUE(selector.BuildPlan({}).empty());
}

TEST(ProviderSelectorTest, FallbackAlwaysPicksHighestPriority)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{MakeRecord("P1", ServicePriority::High, 0), MakeRecord("P2", ServicePriority::Normal, 1)};

  for (int i = 0; i < 5; ++i)
  {
    const auto plan = selector.BuildPlan(ordered);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0].Members.front().Name, "P1");
    EXPECT_EQ(plan[1].Members.front().Name, "P2");
  }
}

TEST(ProviderSelectorTest, GroupsByPriorityAndPriorityGroup)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("a", ServicePriority::High, 0),
    MakeRecord("b", ServicePriority::High, 1),
    MakeRecord("c", ServicePriority::High, 2, SelectionStrategy::Fallback, 1),
    MakeRecord("d", ServicePriority::Low, 3),
  };

  const auto plan = selector.BuildPlan(ordered);

  ASSERT_EQ(plan.size(), 3u);
  EXPECT_EQ(GetMemberNames(plan[0]), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(GetMemberNames(plan[1]), (std::vector<std::string>{"c"}));
  EXPECT_EQ(GetMemberNames(plan[2]), (std::vector<std::string>{"d"}));
}

TEST(ProviderSelectorTest, RoundRobinRotatesThroughTiedProviders)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("a", ServicePriority::Normal, 0, SelectionStrategy::RoundRobin),
    MakeRecord("b", ServicePriority::Normal, 1, SelectionStrategy::RoundRobin),
    MakeRecord("c", ServicePriority::Normal, 2, SelectionStrategy::RoundRobin),
  };

  std::vector<std::string> firstPicks;
  for (int i = 0; i < 4; ++i)
  {
    const auto plan = selector.BuildPlan(ordered);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].Strategy, SelectionStrategy::RoundRobin);
    EXPECT_EQ(plan[0].Members.size(), 3u);
    firstPicks.push_back(plan[0].Members.front().Name);
  }

  EXPECT_EQ(firstPicks, (std::vector<std::string>{"a", "b", "c", "a"}));
}

TEST(ProviderSelectorTest, RoundRobinDistributesEvenly)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("a", ServicePriority::Normal, 0, SelectionStrategy::RoundRobin),
    MakeRecord("b", ServicePriority::Normal, 1, SelectionStrategy::RoundRobin),
    MakeRecord("c", ServicePriority::Normal, 2, SelectionStrategy::RoundRobin),
  };

  std::map<std::string, int> visits;
  for (int i = 0; i < 10; ++i)
  {
    ++visits[selector.BuildPlan(ordered)[0].Members.front().Name];
  }

  ASSERT_EQ(visits.size(), 3u);
  const auto [minItr, maxItr] = std::minmax_element(visits.begin(), visits.end(), [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });
  EXPECT_LE(maxItr->second - minItr->second, 1);
}

TEST(ProviderSelectorTest, ResetRestartsRotation)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("a", ServicePriority::Normal, 0, SelectionStrategy::RoundRobin),
    MakeRecord("b", ServicePriority::Normal, 1, SelectionStrategy::RoundRobin),
  };
  EXPECT_EQ(selector.BuildPlan(ordered)[0].Members.front().Name, "a");
  EXPECT_EQ(selector.BuildPlan(ordered)[0].Members.front().Name, "b");

  selector.Reset();

  EXPECT_EQ(selector.BuildPlan(ordered)[0].Members.front().Name, "a");
}

TEST(ProviderSelectorTest, LatencyBasedPrefersUnmeasuredThenFastest)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("slow", ServicePriority::Normal, 0, SelectionStrategy::LatencyBased, 0, 50.0),
    MakeRecord("new", ServicePriority::Normal, 1, SelectionStrategy::LatencyBased),
    MakeRecord("fast", ServicePriority::Normal, 2, SelectionStrategy::LatencyBased, 0, 10.0),
  };

  const auto plan = selector.BuildPlan(ordered);

  ASSERT_EQ(plan.size(), 1u);
  EXPECT_EQ(GetMemberNames(plan[0]), (std::vector<std::string>{"new", "fast", "slow"}));
}

TEST(ProviderSelectorTest, LatencyTiesKeepRegistrationOrder)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("first", ServicePriority::Normal, 0, SelectionStrategy::LatencyBased, 0, 20.0),
    MakeRecord("second", ServicePriority::Normal, 1, SelectionStrategy::LatencyBased, 0, 20.0),
  };

  EXPECT_EQ(GetMemberNames(selector.BuildPlan(ordered)[0]), (std::vector<std::string>{"first", "second"}));
}

TEST(ProviderSelectorTest, GroupStrategyComesFromFirstRegisteredMember)
{
  ProviderSelector selector;
  // Domain promotion can put a later registration in front
  auto promoted = MakeRecord("promoted", ServicePriority::Low, 5, SelectionStrategy::RoundRobin);
  promoted.EffectivePriority = GetPriorityValue(ServicePriority::Normal);
  const std::vector<ProviderRecord> ordered{promoted, MakeRecord("original", ServicePriority::Normal, 1, SelectionStrategy::Fallback)};

  const auto plan = selector.BuildPlan(ordered);

  ASSERT_EQ(plan.size(), 1u);
  EXPECT_EQ(plan[0].Strategy, SelectionStrategy::Fallback);
  EXPECT_EQ(GetMemberNames(plan[0]), (std::vector<std::string>{"promoted", "original"}));
}

TEST(ProviderSelectorTest, OverrideReplacesDeclaredStrategy)
{
  ProviderSelector selector;
  const std::vector<ProviderRecord> ordered{
    MakeRecord("slow", ServicePriority::Normal, 0, SelectionStrategy::Fallback, 0, 80.0),
    MakeRecord("fast", ServicePriority::Normal, 1, SelectionStrategy::Fallback, 0, 5.0),
  };

  const auto plan = selector.BuildPlan(ordered, SelectionStrategy::LatencyBased);

  ASSERT_EQ(plan.size(), 1u);
  EXPECT_EQ(plan[0].Strategy, SelectionStrategy::LatencyBased);
  EXPECT_EQ(plan[0].Members.front().Name, "fast");
}
