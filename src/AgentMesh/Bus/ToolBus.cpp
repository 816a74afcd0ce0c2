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

#include <AgentMesh/Bus/ToolBus.hpp>
#include <AgentMesh/Service/IToolService.hpp>
#include <algorithm>
#include <memory>
#include <set>
#include <typeinfo>
#include <utility>

namespace AgentMesh
{
  ToolBus::ToolBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config)
    : BusBase(ServiceType::Tool, registry, invoker, config)
  {
  }

  ToolBus::~ToolBus()
  {
    Stop();
  }

  ToolExecutionResult ToolBus::ExecuteTool(const std::string& toolName, const ToolParameters& parameters, const std::string_view handlerName)
  {
    EnsureRunning("ToolBus::ExecuteTool");
    ++m_executions;

    ToolExecutionResult result;
    result.ToolName = toolName;
    result.CorrelationId = NextCorrelationId();

    auto candidates = FindProviders(ProviderQuery{});
    std::erase_if(candidates,
                  [this, &toolName](const ProviderRecord& record)
                  {
                    const auto tools = ListTools(record);
                    return std::find(tools.begin(), tools.end(), toolName) == tools.end();
                  });

    if (candidates.empty())
    {
      GetLogger()->warn("ExecuteTool: no available provider offers tool '{}' (handler '{}')", toolName, handlerName);
      ++m_errors;
      result.Status = ToolExecutionStatus::NotFound;
      result.Error = fmt::format("No available provider offers tool '{}'", toolName);
      return result;
    }

    try
    {
      auto executed = TryExecute<ToolExecutionResult>(std::move(candidates), "ExecuteTool",
                                                      [this, &toolName, &parameters](const ProviderRecord& record)
                                                      {
                                                        auto service = record.GetInstance<IToolService>();
                                                        auto providerResult = InvokeProvider<ToolExecutionResult>(
                                                          record,
                                                          [service, toolName, parameters, name = record.Name](std::stop_token stopToken)
                                                          {
                                                            auto toolResult = service->ExecuteTool(toolName, parameters, stopToken);
                                                            if (toolResult.Status == ToolExecutionStatus::Failed)
                                                            {
                                                              throw OperationFailedException(fmt::format(
                                                                "Provider '{}' failed to execute '{}': {}", name, toolName,
                                                                toolResult.Error.value_or("no error given")));
                                                            }
                                                            return toolResult;
                                                          });
                                                        providerResult.ProviderName = record.Name;
                                                        return providerResult;
                                                      });
      if (executed.has_value())
      {
        executed->ToolName = toolName;
        executed->CorrelationId = result.CorrelationId;
        if (executed->Status != ToolExecutionStatus::Completed)
        {
          ++m_errors;
        }
        return std::move(*executed);
      }

      // Every candidate refused the call between the lookup and the attempt
      ++m_errors;
      result.Status = ToolExecutionStatus::NotFound;
      result.Error = fmt::format("No available provider offers tool '{}'", toolName);
      return result;
    }
    catch (const OperationFailedException& ex)
    {
      ++m_errors;
      const auto& failures = ex.GetFailures();
      const bool allTimedOut =
        !failures.empty() && std::all_of(failures.begin(), failures.end(), [](const ProviderFailure& failure) { return failure.TimedOut; });
      result.Status = allTimedOut ? ToolExecutionStatus::Timeout : ToolExecutionStatus::Failed;
      result.Error = failures.empty() ? std::string(ex.what()) : failures.back().Message;
      if (!failures.empty())
      {
        result.ProviderName = failures.back().ProviderName;
      }
      return result;
    }
  }

  std::vector<std::string> ToolBus::GetAvailableTools()
  {
    std::set<std::string> tools;
    for (const auto& record : FindProviders(ProviderQuery{}, ProviderLookup::Listing))
    {
      const auto providerTools = ListTools(record);
      tools.insert(providerTools.begin(), providerTools.end());
    }
    return {tools.begin(), tools.end()};
  }

  std::optional<ToolInfo> ToolBus::GetToolInfo(const std::string& toolName)
  {
    for (const auto& record : FindProviders(ProviderQuery{}, ProviderLookup::Listing))
    {
      const auto tools = ListTools(record);
      if (std::find(tools.begin(), tools.end(), toolName) == tools.end())
      {
        continue;
      }
      auto info = DescribeTool(record, toolName);
      if (info.has_value())
      {
        return info;
      }
    }
    return std::nullopt;
  }

  std::vector<ToolInfo> ToolBus::GetAllToolInfo()
  {
    std::vector<ToolInfo> result;
    std::set<std::string> seen;
    for (const auto& record : FindProviders(ProviderQuery{}, ProviderLookup::Listing))
    {
      for (const auto& toolName : ListTools(record))
      {
        if (seen.count(toolName) != 0)
        {
          continue;
        }
        auto info = DescribeTool(record, toolName);
        if (info.has_value())
        {
          seen.insert(toolName);
          result.push_back(std::move(*info));
        }
      }
    }
    return result;
  }

  std::vector<ProviderRecord> ToolBus::GetProvidersByMetadata(const std::string_view key, const std::string_view value)
  {
    auto providers = FindProviders(ProviderQuery{}, ProviderLookup::Listing);
    std::erase_if(providers,
                  [key, value](const ProviderRecord& record)
                  {
                    const auto itr = record.Metadata.find(key);
                    return itr == record.Metadata.end() || itr->second != value;
                  });
    return providers;
  }

  void ToolBus::ProcessMessage(BusMessage& message)
  {
    GetLogger()->warn("ToolBus: tool operations are synchronous, ignoring queued message {} ({})", message.CorrelationId, typeid(message).name());
  }

  void ToolBus::CollectMetrics(std::map<std::string, double>& rMetrics) const
  {
    rMetrics["tool_executions"] = static_cast<double>(m_executions.load());
    rMetrics["tool_errors"] = static_cast<double>(m_errors.load());
  }

  std::vector<std::string> ToolBus::ListTools(const ProviderRecord& record) const
  {
    std::shared_ptr<IToolService> service;
    try
    {
      service = record.GetInstance<IToolService>();
    }
    catch (const ProviderCastException& ex)
    {
      GetLogger()->error("ListTools: {}", ex.what());
      return {};
    }
    auto tools = QueryProvider<std::vector<std::string>>(record, "ListTools",
                                                         [service](std::stop_token /*stopToken*/) { return service->GetAvailableTools(); });
    return tools.value_or(std::vector<std::string>{});
  }

  std::optional<ToolInfo> ToolBus::DescribeTool(const ProviderRecord& record, const std::string& toolName) const
  {
    std::shared_ptr<IToolService> service;
    try
    {
      service = record.GetInstance<IToolService>();
    }
    catch (const ProviderCastException& ex)
    {
      GetLogger()->error("DescribeTool: {}", ex.what());
      return std::nullopt;
    }
    auto info = QueryProvider<std::optional<ToolInfo>>(record, "DescribeTool",
                                                       [service, toolName](std::stop_token /*stopToken*/) { return service->GetToolInfo(toolName); });
    return info.value_or(std::nullopt);
  }
}
