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
#include <AgentMesh/Exception/ProviderUnavailableException.hpp>
#include <AgentMesh/Service/ILlmService.hpp>
#include <algorithm>
#include <memory>
#include <set>
#include <typeinfo>
#include <utility>

namespace AgentMesh
{
  LlmBus::LlmBus(ServiceRegistry& registry, ProviderInvoker& invoker, const LlmBusConfig& config)
    : BusBase(ServiceType::Llm, registry, invoker, config)
    , m_llmConfig(config)
    , m_clock(registry.GetClock())
  {
    m_llmConfig.Validate();
  }

  LlmBus::~LlmBus()
  {
    Stop();
  }

  LlmResult LlmBus::CallLlm(const LlmRequest& request, const std::string_view handlerName)
  {
    EnsureRunning("LlmBus::CallLlm");
    {
      std::lock_guard<std::mutex> lock(m_statsMutex);
      ++m_totalRequests;
    }

    ProviderQuery query;
    query.Domain = request.Domain;
    auto candidates = FindProviders(std::move(query));
    std::erase_if(candidates, [this](const ProviderRecord& record) { return IsInCooldown(record.Handle); });

    if (candidates.empty())
    {
      {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_failedRequests;
      }
      GetLogger()->error("CallLlm: no LLM provider available for domain '{}' (handler '{}')", request.Domain.value_or("any"), handlerName);
      throw ProviderUnavailableException(fmt::format("No LLM service available for domain '{}'", request.Domain.value_or("any")));
    }

    try
    {
      auto result = TryExecute<LlmResult>(std::move(candidates), "CallLlm",
                                          [this, &request](const ProviderRecord& record)
                                          {
                                            auto service = record.GetInstance<ILlmService>();
                                            try
                                            {
                                              const auto start = SteadyClock::now();
                                              LlmResult callResult = InvokeProvider<LlmResult>(
                                                record, [service, request](std::stop_token stopToken) { return service->CallLlm(request, stopToken); });
                                              callResult.ProviderName = record.Name;
                                              callResult.Latency = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
                                              RecordCallSuccess(record, callResult);
                                              return callResult;
                                            }
                                            catch (const ProviderRateLimitedException& ex)
                                            {
                                              EnterCooldown(record, ex.GetRetryAfter());
                                              throw;
                                            }
                                            catch (const std::exception&)
                                            {
                                              RecordCallFailure(record);
                                              throw;
                                            }
                                          });
      if (result.has_value())
      {
        GetLogger()->debug("CallLlm: '{}' answered for '{}' in {}ms", result->ProviderName, handlerName, result->Latency.count());
        return std::move(*result);
      }
    }
    catch (const OperationFailedException& ex)
    {
      {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_failedRequests;
      }
      std::vector<ProviderFailure> failures = ex.GetFailures();
      std::string detail;
      for (const auto& failure : failures)
      {
        detail += fmt::format("{}{}: {}", detail.empty() ? "" : "; ", failure.ProviderName, failure.Message);
      }
      throw OperationFailedException(fmt::format("All LLM services failed ({})", detail), std::move(failures));
    }

    {
      std::lock_guard<std::mutex> lock(m_statsMutex);
      ++m_failedRequests;
    }
    throw ProviderUnavailableException("No LLM service accepted the call, all circuit breakers refused");
  }

  std::vector<std::string> LlmBus::GetAvailableModels()
  {
    std::set<std::string> models;
    for (const auto& record : FindProviders(ProviderQuery{}, ProviderLookup::Listing))
    {
      std::shared_ptr<ILlmService> service;
      try
      {
        service = record.GetInstance<ILlmService>();
      }
      catch (const ProviderCastException& ex)
      {
        GetLogger()->error("GetAvailableModels: {}", ex.what());
        continue;
      }
      const auto providerModels = QueryProvider<std::vector<std::string>>(
        record, "GetAvailableModels", [service](std::stop_token /*stopToken*/) { return service->GetAvailableModels(); });
      if (providerModels.has_value())
      {
        models.insert(providerModels->begin(), providerModels->end());
      }
    }
    return {models.begin(), models.end()};
  }

  std::map<std::string, LlmServiceStats> LlmBus::GetServiceStats() const
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_serviceStats;
  }

  bool LlmBus::IsInCooldown(const ProviderHandle& handle) const
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    const auto itr = m_cooldowns.find(handle);
    return itr != m_cooldowns.end() && m_clock() < itr->second;
  }

  void LlmBus::ProcessMessage(BusMessage& message)
  {
    GetLogger()->warn("LlmBus: LLM calls are synchronous, ignoring queued message {} ({})", message.CorrelationId, typeid(message).name());
  }

  void LlmBus::CollectMetrics(std::map<std::string, double>& rMetrics) const
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    rMetrics["llm_requests"] = static_cast<double>(m_totalRequests);
    rMetrics["llm_failed_requests"] = static_cast<double>(m_failedRequests);

    const auto now = m_clock();
    const auto cooling = std::count_if(m_cooldowns.begin(), m_cooldowns.end(), [now](const auto& entry) { return now < entry.second; });
    rMetrics["providers_in_cooldown"] = static_cast<double>(cooling);
  }

  void LlmBus::RecordCallSuccess(const ProviderRecord& record, const LlmResult& result)
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    auto& stats = m_serviceStats[record.Name];
    ++stats.TotalRequests;
    const auto successes = stats.TotalRequests - stats.FailedRequests - stats.RateLimitedRequests;
    stats.AverageLatencyMs += (static_cast<double>(result.Latency.count()) - stats.AverageLatencyMs) / static_cast<double>(successes);
    stats.TotalInputTokens += result.Usage.InputTokens;
    stats.TotalOutputTokens += result.Usage.OutputTokens;
    stats.TotalCostCents += result.Usage.CostCents;
    stats.LastRequestTime = m_clock();
    m_cooldowns.erase(record.Handle);
    stats.CooldownUntil.reset();
  }

  void LlmBus::RecordCallFailure(const ProviderRecord& record)
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    auto& stats = m_serviceStats[record.Name];
    ++stats.TotalRequests;
    ++stats.FailedRequests;
    stats.LastRequestTime = m_clock();
  }

  void LlmBus::EnterCooldown(const ProviderRecord& record, const std::optional<std::chrono::milliseconds> retryAfter)
  {
    const auto cooldown = retryAfter.value_or(m_llmConfig.RateLimitCooldown);
    const auto until = m_clock() + cooldown;
    {
      std::lock_guard<std::mutex> lock(m_statsMutex);
      auto& stats = m_serviceStats[record.Name];
      ++stats.TotalRequests;
      ++stats.RateLimitedRequests;
      stats.LastRequestTime = m_clock();
      stats.CooldownUntil = until;
      m_cooldowns[record.Handle] = until;
    }
    GetLogger()->warn("CallLlm: provider '{}' is rate limited, cooling down for {}ms", record.Name, cooldown.count());
  }
}
