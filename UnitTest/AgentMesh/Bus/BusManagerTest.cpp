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

#include <AgentMesh/Bus/BusManager.hpp>
#include <gtest/gtest.h>
#include <TestProviders.hpp>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace AgentMesh;
using namespace AgentMesh::Test;

namespace
{
  std::vector<ServiceType> GetTypes(const std::vector<BusStats>& stats)
  {
    std::vector<ServiceType> types;
    for (const auto& entry : stats)
    {
      types.push_back(entry.Type);
    }
    return types;
  }
}

TEST(BusManagerTest, StartsAndStopsEveryBus)
{
  ServiceRegistry registry;
  BusManager manager(registry);

  manager.Start();
  const auto running = manager.GetAllStats();
  ASSERT_EQ(running.size(), 5u);
  for (const auto& stats : running)
  {
    EXPECT_TRUE(stats.Running) << ToString(stats.Type);
  }
  EXPECT_EQ(GetTypes(running), (std::vector<ServiceType>{ServiceType::Communication, ServiceType::Tool, ServiceType::Llm,
                                                         ServiceType::WiseAuthority, ServiceType::RuntimeControl}));

  EXPECT_TRUE(manager.Stop());
  for (const auto& stats : manager.GetAllStats())
  {
    EXPECT_FALSE(stats.Running) << ToString(stats.Type);
  }
  EXPECT_EQ(manager.GetTotalQueueSize(), 0u);
}

TEST(BusManagerTest, InvalidConfigThrows)
{
  ServiceRegistry registry;
  MeshConfig config;
  config.Invoker.ThreadCount = 0;

  EXPECT_THROW(BusManager manager(registry, config), std::invalid_argument);
}

TEST(BusManagerTest, InvalidBusConfigThrows)
{
  ServiceRegistry registry;
  MeshConfig config;
  config.Wise.MaxGuidanceFanOut = 0;

  EXPECT_THROW(BusManager manager(registry, config), std::invalid_argument);
}

TEST(BusManagerTest, BusesShareTheRegistry)
{
  ServiceRegistry registry;
  BusManager manager(registry);
  manager.Start();
  auto tool = std::make_shared<FakeToolService>("calc", std::vector<std::string>{"add"});
  RegisterProvider(registry, ServiceType::Tool, tool);
  auto channel = std::make_shared<FakeCommunicationService>("chat");
  RegisterProvider(registry, ServiceType::Communication, channel);

  EXPECT_EQ(&manager.GetRegistry(), &registry);
  EXPECT_EQ(manager.GetToolBus().ExecuteTool("add", {}, "handler").ProviderName, "calc");
  EXPECT_TRUE(manager.GetCommunicationBus().SendMessage("general", "hi", "handler"));
  EXPECT_EQ(tool->GetCalls(), 1u);
  EXPECT_EQ(channel->GetSendCalls(), 1u);
}

TEST(BusManagerTest, QueuedWorkIsDrainedOnStop)
{
  ServiceRegistry registry;
  BusManager manager(registry);
  auto channel = std::make_shared<FakeCommunicationService>("chat");
  RegisterProvider(registry, ServiceType::Communication, channel);
  manager.Start();

  for (int i = 0; i < 5; ++i)
  {
    ASSERT_TRUE(manager.GetCommunicationBus().SubmitMessage("general", "queued", "handler"));
  }
  EXPECT_TRUE(manager.Stop());

  EXPECT_EQ(channel->GetSent().size(), 5u);
  EXPECT_EQ(manager.GetCommunicationBus().GetStats().Processed, 5u);
}
