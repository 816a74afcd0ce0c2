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
#include <AgentMesh/Log/LogHelper.hpp>

namespace AgentMesh
{
  namespace
  {
    AGENTMESH_LOGGER_NAME(BusManager);

    const MeshConfig& Validated(const MeshConfig& config)
    {
      config.Validate();
      return config;
    }
  }

  BusManager::BusManager(ServiceRegistry& registry, const MeshConfig& config)
    : m_registry(registry)
    , m_invoker(Validated(config).Invoker)
    , m_communication(registry, m_invoker, config.Communication)
    , m_tool(registry, m_invoker, config.Tool)
    , m_llm(registry, m_invoker, config.Llm)
    , m_wise(registry, m_invoker, config.Wise)
    , m_runtimeControl(registry, m_invoker, config.RuntimeControl)
  {
  }

  BusManager::~BusManager()
  {
    Stop();
  }

  void BusManager::Start()
  {
    m_communication.Start();
    m_tool.Start();
    m_llm.Start();
    m_wise.Start();
    m_runtimeControl.Start();
    Log::GetLogger<LoggerName_BusManager>()->info("Started {} buses", GetBuses().size());
  }

  bool BusManager::Stop()
  {
    // Stop every bus even if an earlier one had to abandon messages
    bool clean = m_communication.Stop();
    clean = m_tool.Stop() && clean;
    clean = m_llm.Stop() && clean;
    clean = m_wise.Stop() && clean;
    clean = m_runtimeControl.Stop() && clean;
    if (!clean)
    {
      Log::GetLogger<LoggerName_BusManager>()->warn("Stopped buses, some queued messages were abandoned");
    }
    return clean;
  }

  std::vector<BusStats> BusManager::GetAllStats() const
  {
    std::vector<BusStats> stats;
    for (const auto* bus : GetBuses())
    {
      stats.push_back(bus->GetStats());
    }
    return stats;
  }

  std::size_t BusManager::GetTotalQueueSize() const
  {
    std::size_t total = 0;
    for (const auto* bus : GetBuses())
    {
      total += bus->GetStats().QueueSize;
    }
    return total;
  }

  std::vector<const BusBase*> BusManager::GetBuses() const
  {
    return {&m_communication, &m_tool, &m_llm, &m_wise, &m_runtimeControl};
  }
}
