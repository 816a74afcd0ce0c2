#ifndef AGENTMESH_RESILIENCE_CIRCUITBREAKERSTATS_HPP
#define AGENTMESH_RESILIENCE_CIRCUITBREAKERSTATS_HPP
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

#include <AgentMesh/Resilience/CircuitState.hpp>
#include <AgentMesh/Util/SteadyClock.hpp>
#include <cstdint>
#include <optional>

namespace AgentMesh
{
  /// @brief Point in time copy of a circuit breaker's counters.
  struct CircuitBreakerStats
  {
    CircuitState State{CircuitState::Closed};
    uint32_t FailureCount{0};
    uint32_t SuccessCount{0};
    std::optional<SteadyClock::time_point> LastFailureTime;

    uint64_t TotalSuccesses{0};
    uint64_t TotalFailures{0};
    /// @brief Number of times the breaker has transitioned into the open state.
    uint64_t TimesOpened{0};
    uint32_t ActiveProbes{0};
  };
}

#endif
