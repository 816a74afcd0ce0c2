#ifndef AGENTMESH_REGISTRY_PROVIDERMETRICS_HPP
#define AGENTMESH_REGISTRY_PROVIDERMETRICS_HPP
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

#include <AgentMesh/Util/SteadyClock.hpp>
#include <cstdint>
#include <optional>

namespace AgentMesh
{
  /// @brief Request accounting kept by the registry for each provider.
  struct ProviderMetrics
  {
    uint64_t TotalRequests{0};
    uint64_t FailedRequests{0};
    uint32_t ConsecutiveFailures{0};
    /// @brief Running average of the successful call latencies in milliseconds.
    double AverageLatencyMs{0.0};
    /// @brief Number of latencies AverageLatencyMs is built from. Zero means unmeasured.
    uint64_t LatencySamples{0};
    std::optional<SteadyClock::time_point> LastRequestTime;
    std::optional<SteadyClock::time_point> LastFailureTime;

    [[nodiscard]] bool HasLatency() const noexcept
    {
      return LatencySamples > 0;
    }
  };
}

#endif
