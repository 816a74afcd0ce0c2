#ifndef AGENTMESH_RESILIENCE_CIRCUITBREAKER_HPP
#define AGENTMESH_RESILIENCE_CIRCUITBREAKER_HPP
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

#include <AgentMesh/Resilience/CircuitBreakerConfig.hpp>
#include <AgentMesh/Resilience/CircuitBreakerStats.hpp>
#include <AgentMesh/Resilience/CircuitState.hpp>
#include <AgentMesh/Util/SteadyClock.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace AgentMesh
{
  /// @brief Per provider state machine that stops calls to a provider after repeated failures.
  ///
  /// State transitions:
  ///   Closed   -> Open      when FailureThreshold consecutive failures have been recorded.
  ///   Open     -> HalfOpen  on the first availability check after RecoveryTimeout.
  ///   HalfOpen -> Closed    when SuccessThreshold consecutive successes have been recorded.
  ///   HalfOpen -> Open      on any failure.
  ///
  /// Every member is serialized by one mutex owned by the breaker. The breaker is owned by the
  /// ServiceRegistry and is never handed out to callers.
  class CircuitBreaker
  {
    std::string m_name;
    CircuitBreakerConfig m_config;
    ClockFunction m_clock;

    mutable std::mutex m_mutex;
    CircuitState m_state{CircuitState::Closed};
    uint32_t m_failureCount{0};
    uint32_t m_successCount{0};
    std::optional<SteadyClock::time_point> m_lastFailureTime;
    uint64_t m_totalSuccesses{0};
    uint64_t m_totalFailures{0};
    uint64_t m_timesOpened{0};
    uint32_t m_activeProbes{0};

  public:
    /// @brief Creates a closed breaker.
    /// @param name The name used when logging transitions (normally the provider name).
    /// @param config The breaker configuration, validated on construction.
    /// @param clock Time source used for the recovery timeout.
    /// @throws std::invalid_argument if the config is invalid.
    CircuitBreaker(std::string name, const CircuitBreakerConfig& config, ClockFunction clock = DefaultClock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    /// @brief Checks if a call may be attempted.
    ///
    /// An open breaker whose recovery timeout has elapsed is moved to half-open by this call.
    /// @return true while closed or half-open.
    bool IsAvailable();

    /// @brief Claims permission to perform a call.
    ///
    /// Behaves like IsAvailable, and while half-open also enforces MaxHalfOpenProbes. A granted
    /// probe is released by the next RecordSuccess or RecordFailure, or by ReleaseProbe.
    bool TryAcquireProbe();

    /// @brief Returns a probe slot claimed by TryAcquireProbe whose call ended without an outcome.
    void ReleaseProbe();

    void RecordSuccess();
    void RecordFailure();

    /// @brief Forces the breaker back to closed with zero counters.
    void Reset();

    /// @brief The current state. Unlike IsAvailable this never performs a transition.
    [[nodiscard]] CircuitState GetState() const;

    [[nodiscard]] CircuitBreakerStats GetStats() const;

    [[nodiscard]] const std::string& GetName() const noexcept
    {
      return m_name;
    }

    [[nodiscard]] const CircuitBreakerConfig& GetConfig() const noexcept
    {
      return m_config;
    }

  private:
    bool RecoveryElapsed(SteadyClock::time_point now) const;
    void TransitionTo(CircuitState newState);
    void DropActiveProbe() noexcept;
  };
}

#endif
