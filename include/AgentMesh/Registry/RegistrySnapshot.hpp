#ifndef AGENTMESH_REGISTRY_REGISTRYSNAPSHOT_HPP
#define AGENTMESH_REGISTRY_REGISTRYSNAPSHOT_HPP
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

#include <AgentMesh/Registry/ProviderMetadata.hpp>
#include <AgentMesh/Registry/ProviderMetrics.hpp>
#include <AgentMesh/Registry/SelectionStrategy.hpp>
#include <AgentMesh/Registry/ServicePriority.hpp>
#include <AgentMesh/Registry/ServicePriorityGroup.hpp>
#include <AgentMesh/Registry/ServiceType.hpp>
#include <AgentMesh/Resilience/CircuitBreakerStats.hpp>
#include <map>
#include <string>
#include <vector>

namespace AgentMesh
{
  struct ProviderSnapshot
  {
    std::string Name;
    ServicePriority Priority{ServicePriority::Normal};
    ServicePriorityGroup PriorityGroup;
    std::vector<std::string> Capabilities;
    SelectionStrategy Strategy{SelectionStrategy::Fallback};
    ProviderMetadata Metadata;
    CircuitBreakerStats Breaker;
    ProviderMetrics Metrics;
  };

  /// @brief Read only diagnostic view of the registry. Providers are listed in routing order.
  struct RegistrySnapshot
  {
    std::map<ServiceType, std::vector<ProviderSnapshot>> Providers;

    [[nodiscard]] std::size_t GetProviderCount() const noexcept
    {
      std::size_t count = 0;
      for (const auto& entry : Providers)
      {
        count += entry.second.size();
      }
      return count;
    }
  };
}

#endif
