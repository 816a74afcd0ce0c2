#ifndef AGENTMESH_BUS_LLMBUS_HPP
#define AGENTMESH_BUS_LLMBUS_HPP
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
#include <AgentMesh/Registry/ProviderHandle.hpp>
#include <AgentMesh/Service/LlmTypes.hpp>
#include <AgentMesh/Util/SteadyClock.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AgentMesh
{
  /// @brief Per provider usage as seen by the LLM bus.
  struct LlmServiceStats
  {
    uint64_t TotalRequests{0};
    uint64_t FailedRequests{0};
    uint64_t RateLimitedRequests{0};
    double AverageLatencyMs{0.0};
    uint64_t TotalInputTokens{0};
    uint64_t TotalOutputTokens{0};
    double TotalCostCents{0.0};
    std::optional<SteadyClock::time_point> LastRequestTime;
    std::optional<SteadyClock::time_point> CooldownUntil;
  };

  /// @brief Routes completions to language model providers.
  ///
  /// Requests with a domain only reach providers of that domain or of the general domain, and
  /// exact domain providers are promoted one priority tier. Providers are picked by the lowest
  /// average latency unless configured otherwise. A provider that reports rate limiting is put
  /// into a cooldown and skipped until it ends; this does not count as a circuit breaker failure.
  class LlmBus final : public BusBase
  {
    LlmBusConfig m_llmConfig;
    ClockFunction m_clock;

    mutable std::mutex m_statsMutex;
    std::map<std::string, LlmServiceStats> m_serviceStats;
    std::map<ProviderHandle, SteadyClock::time_point> m_cooldowns;
    uint64_t m_totalRequests{0};
    uint64_t m_failedRequests{0};

  public:
    LlmBus(ServiceRegistry& registry, ProviderInvoker& invoker, const LlmBusConfig& config = {});
    ~LlmBus() override;

    /// @brief Performs a completion on the best available provider, failing over across providers.
    /// @throws ProviderUnavailableException if no provider is eligible.
    /// @throws OperationFailedException if every attempted provider failed.
    LlmResult CallLlm(const LlmRequest& request, std::string_view handlerName);

    /// @brief The sorted union of the models offered by the available providers.
    std::vector<std::string> GetAvailableModels();

    /// @brief Usage per provider name.
    std::map<std::string, LlmServiceStats> GetServiceStats() const;

    [[nodiscard]] bool IsInCooldown(const ProviderHandle& handle) const;

  protected:
    void ProcessMessage(BusMessage& message) override;
    void CollectMetrics(std::map<std::string, double>& rMetrics) const override;

  private:
    void RecordCallSuccess(const ProviderRecord& record, const LlmResult& result);
    void RecordCallFailure(const ProviderRecord& record);
    void EnterCooldown(const ProviderRecord& record, std::optional<std::chrono::milliseconds> retryAfter);
  };
}

#endif
