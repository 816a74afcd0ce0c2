#ifndef AGENTMESH_BUS_TOOLBUS_HPP
#define AGENTMESH_BUS_TOOLBUS_HPP
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

#include <AgentMesh/Bus/BusBase.hpp>
#include <AgentMesh/Service/ToolTypes.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AgentMesh
{
  /// @brief Routes tool executions to the providers offering the tool.
  class ToolBus final : public BusBase
  {
    std::atomic<uint64_t> m_executions{0};
    std::atomic<uint64_t> m_errors{0};

  public:
    ToolBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config = {});
    ~ToolBus() override;

    /// @brief Executes a tool on the best available provider that offers it.
    ///
    /// Only providers listing the tool are considered; if there are none the result has status
    /// NotFound. A provider that throws, times out or returns status Failed is recorded as failed
    /// and the next provider is tried. If every provider fails the status is Failed, or Timeout
    /// when every failure was a timeout.
    ToolExecutionResult ExecuteTool(const std::string& toolName, const ToolParameters& parameters, std::string_view handlerName);

    /// @brief The sorted union of the tools offered by the available providers.
    std::vector<std::string> GetAvailableTools();

    /// @brief Tool description from the highest priority provider offering the tool.
    std::optional<ToolInfo> GetToolInfo(const std::string& toolName);

    /// @brief One description per tool name, from the highest priority provider offering it.
    std::vector<ToolInfo> GetAllToolInfo();

    /// @brief Available providers whose metadata has key set to value.
    std::vector<ProviderRecord> GetProvidersByMetadata(std::string_view key, std::string_view value);

  protected:
    void ProcessMessage(BusMessage& message) override;
    void CollectMetrics(std::map<std::string, double>& rMetrics) const override;

  private:
    std::vector<std::string> ListTools(const ProviderRecord& record) const;
    std::optional<ToolInfo> DescribeTool(const ProviderRecord& record, const std::string& toolName) const;
  };
}

#endif
