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

#include <AgentMesh/Log/LogHelper.hpp>
#include <AgentMesh/Resilience/CircuitBreaker.hpp>
#include <utility>

namespace AgentMesh
{
  namespace
  {
    AGENTMESH_LOGGER_NAME(CircuitBreaker);
  }

  CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerConfig& config, ClockFunction clock)
    : m_name(std::move(name))
    , m_config(config)
    , m_clock(clock ? std::move(clock) : DefaultClock())
  {
    m_config.Validate();
  }

  bool CircuitBreaker::IsAvailable()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::Open && RecoveryElapsed(m_clock()))
    {
      TransitionTo(CircuitState::HalfOpen);
    }
    return m_state != CircuitState::Open;
  }

  bool CircuitBreaker::TryAcquireProbe()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::Open && RecoveryElapsed(m_clock()))
    {
      TransitionTo(CircuitState::HalfOpen);
    }

    switch (m_state)
    {
    case CircuitState::Closed:
      return true;
    case CircuitState::Open:
      return false;
    case CircuitState::HalfOpen:
      if (m_config.MaxHalfOpenProbes != 0 && m_activeProbes >= m_config.MaxHalfOpenProbes)
      {
        Log::GetLogger<LoggerName_CircuitBreaker>()->debug("CircuitBreaker '{}': probe limit {} reached", m_name, m_config.MaxHalfOpenProbes);
        return false;
      }
      ++m_activeProbes;
      return true;
    }
    return false;
  }

  void CircuitBreaker::RecordSuccess()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_totalSuccesses;
    switch (m_state)
    {
    case CircuitState::Closed:
      m_failureCount = 0;
      break;
    case CircuitState::HalfOpen:
      DropActiveProbe();
      ++m_successCount;
      if (m_successCount >= m_config.SuccessThreshold)
      {
        TransitionTo(CircuitState::Closed);
      }
      break;
    case CircuitState::Open:
      // A straggling call finished after the breaker opened
      break;
    }
  }

  void CircuitBreaker::RecordFailure()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_totalFailures;
    switch (m_state)
    {
    case CircuitState::Closed:
      ++m_failureCount;
      if (m_failureCount >= m_config.FailureThreshold)
      {
        m_lastFailureTime = m_clock();
        TransitionTo(CircuitState::Open);
      }
      break;
    case CircuitState::HalfOpen:
      DropActiveProbe();
      m_lastFailureTime = m_clock();
      TransitionTo(CircuitState::Open);
      break;
    case CircuitState::Open:
      break;
    }
  }

  void CircuitBreaker::ReleaseProbe()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::HalfOpen)
    {
      DropActiveProbe();
    }
  }

  void CircuitBreaker::Reset()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != CircuitState::Closed)
    {
      TransitionTo(CircuitState::Closed);
    }
    m_failureCount = 0;
    m_successCount = 0;
    m_activeProbes = 0;
  }

  CircuitState CircuitBreaker::GetState() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
  }

  CircuitBreakerStats CircuitBreaker::GetStats() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    CircuitBreakerStats stats;
    stats.State = m_state;
    stats.FailureCount = m_failureCount;
    stats.SuccessCount = m_successCount;
    stats.LastFailureTime = m_lastFailureTime;
    stats.TotalSuccesses = m_totalSuccesses;
    stats.TotalFailures = m_totalFailures;
    stats.TimesOpened = m_timesOpened;
    stats.ActiveProbes = m_activeProbes;
    return stats;
  }

  bool CircuitBreaker::RecoveryElapsed(const SteadyClock::time_point now) const
  {
    if (!m_lastFailureTime.has_value())
    {
      return true;
    }
    return (now - *m_lastFailureTime) >= m_config.RecoveryTimeout;
  }

  // Caller must hold m_mutex
  void CircuitBreaker::TransitionTo(const CircuitState newState)
  {
    const CircuitState oldState = m_state;
    m_state = newState;
    m_failureCount = 0;
    m_successCount = 0;
    m_activeProbes = 0;

    auto logger = Log::GetLogger<LoggerName_CircuitBreaker>();
    switch (newState)
    {
    case CircuitState::Open:
      ++m_timesOpened;
      logger->warn("CircuitBreaker '{}': {} -> {} (recovery in {}ms)", m_name, ToString(oldState), ToString(newState),
                   m_config.RecoveryTimeout.count());
      break;
    case CircuitState::HalfOpen:
      logger->info("CircuitBreaker '{}': {} -> {}, allowing trial calls", m_name, ToString(oldState), ToString(newState));
      break;
    case CircuitState::Closed:
      logger->info("CircuitBreaker '{}': {} -> {}", m_name, ToString(oldState), ToString(newState));
      break;
    }
  }

  // Caller must hold m_mutex
  void CircuitBreaker::DropActiveProbe() noexcept
  {
    if (m_activeProbes > 0)
    {
      --m_activeProbes;
    }
  }
}
