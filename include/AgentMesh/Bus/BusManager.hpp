#ifndef AGENTMESH_BUS_BUSMANAGER_HPP
#define AGENTMESH_BUS_BUSMANAGER_HPP
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

#include <AgentMesh/Bus/BusStats.hpp>
#include <AgentMesh/Bus/CommunicationBus.hpp>
#include <AgentMesh/Bus/LlmBus.hpp>
#include <AgentMesh/Bus/MeshConfig.hpp>
#include <AgentMesh/Bus/ProviderInvoker.hpp>
#include <AgentMesh/Bus/RuntimeControlBus.hpp>
#include <AgentMesh/Bus/ToolBus.hpp>
#include <AgentMesh/Bus/WiseBus.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <cstddef>
#include <vector>

namespace AgentMesh
{
  /// @brief Owns one bus of each service type over a shared registry and provider invoker.
  class BusManager
  {
    ServiceRegistry& m_registry;
    // Declared before the buses so it outlives them
    ProviderInvoker m_invoker;
    CommunicationBus m_communication;
    ToolBus m_tool;
    LlmBus m_llm;
    WiseBus m_wise;
    RuntimeControlBus m_runtimeControl;

  public:
    explicit BusManager(ServiceRegistry& registry, const MeshConfig& config = {});
    ~BusManager();

    BusManager(const BusManager&) = delete;
    BusManager& operator=(const BusManager&) = delete;
    BusManager(BusManager&&) = delete;
    BusManager& operator=(BusManager&&) = delete;

    /// @brief Starts every bus.
    void Start();

    /// @brief Stops every bus, each with its own drain timeout.
    /// @return false if any bus abandoned messages.
    bool Stop();

    [[nodiscard]] std::vector<BusStats> GetAllStats() const;

    /// @brief Messages queued or being processed across all buses.
    [[nodiscard]] std::size_t GetTotalQueueSize() const;

    ServiceRegistry& GetRegistry() noexcept
    {
      return m_registry;
    }

    CommunicationBus& GetCommunicationBus() noexcept
    {
      return m_communication;
    }

    ToolBus& GetToolBus() noexcept
    {
      return m_tool;
    }

    LlmBus& GetLlmBus() noexcept
    {
      return m_llm;
    }

    WiseBus& GetWiseBus() noexcept
    {
      return m_wise;
    }

    RuntimeControlBus& GetRuntimeControlBus() noexcept
    {
      return m_runtimeControl;
    }

  private:
    std::vector<const BusBase*> GetBuses() const;
  };
}

#endif
