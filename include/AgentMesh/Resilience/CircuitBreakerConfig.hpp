#ifndef AGENTMESH_RESILIENCE_CIRCUITBREAKERCONFIG_HPP
#define AGENTMESH_RESILIENCE_CIRCUITBREAKERCONFIG_HPP
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

#include <fmt/format.h>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace AgentMesh
{
  /// @brief Tuning parameters for a single provider circuit breaker.
  struct CircuitBreakerConfig
  {
    /// @brief Consecutive failures while closed before the breaker opens.
    uint32_t FailureThreshold{5};

    /// @brief Time an open breaker waits before allowing a trial call.
    std::chrono::milliseconds RecoveryTimeout{std::chrono::seconds(60)};

    /// @brief Consecutive successes while half-open before the breaker closes.
    uint32_t SuccessThreshold{3};

    /// @brief Maximum number of concurrent trial calls while half-open. Zero means unlimited.
    uint32_t MaxHalfOpenProbes{0};

    /// @brief Throws std::invalid_argument if the configuration can not produce a working breaker.
    void Validate() const
    {
      if (FailureThreshold == 0)
      {
        throw std::invalid_argument("CircuitBreakerConfig: FailureThreshold must be at least 1");
      }
      if (SuccessThreshold == 0)
      {
        throw std::invalid_argument("CircuitBreakerConfig: SuccessThreshold must be at least 1");
      }
      if (RecoveryTimeout.count() < 0)
      {
        throw std::invalid_argument(fmt::format("CircuitBreakerConfig: RecoveryTimeout can not be negative ({}ms)", RecoveryTimeout.count()));
      }
    }
  };
}

#endif
