#ifndef AGENTMESH_REGISTRY_PROVIDERRECORD_HPP
#define AGENTMESH_REGISTRY_PROVIDERRECORD_HPP
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

#include <AgentMesh/Exception/ProviderCastException.hpp>
#include <AgentMesh/Registry/ProviderHandle.hpp>
#include <AgentMesh/Registry/ProviderMetadata.hpp>
#include <AgentMesh/Registry/ProviderMetrics.hpp>
#include <AgentMesh/Registry/SelectionStrategy.hpp>
#include <AgentMesh/Registry/ServicePriority.hpp>
#include <AgentMesh/Registry/ServicePriorityGroup.hpp>
#include <AgentMesh/Resilience/CircuitState.hpp>
#include <AgentMesh/Service/IService.hpp>
#include <fmt/format.h>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace AgentMesh
{
  /// @brief A copy of a registered provider as returned by registry queries.
  ///
  /// The record does not give access to the circuit breaker; breaker accounting goes through
  /// ServiceRegistry::RecordSuccess and ServiceRegistry::RecordFailure.
  struct ProviderRecord
  {
    ProviderHandle Handle;
    std::string Name;
    std::shared_ptr<IService> Instance;
    ServicePriority Priority{ServicePriority::Normal};
    /// @brief The priority value used for ordering, after domain promotion.
    uint8_t EffectivePriority{GetPriorityValue(ServicePriority::Normal)};
    ServicePriorityGroup PriorityGroup;
    std::set<std::string, std::less<>> Capabilities;
    SelectionStrategy Strategy{SelectionStrategy::Fallback};
    ProviderMetadata Metadata;
    uint64_t RegistrationOrder{0};
    CircuitState BreakerState{CircuitState::Closed};
    ProviderMetrics Metrics;

    [[nodiscard]] bool HasCapability(const std::string_view capability) const
    {
      return Capabilities.find(capability) != Capabilities.end();
    }

    /// @brief Gets the provider as one of its typed interfaces.
    /// @throws ProviderCastException if the provider does not implement T.
    template <typename T>
    std::shared_ptr<T> GetInstance() const
    {
      auto typed = std::dynamic_pointer_cast<T>(Instance);
      if (!typed)
      {
        throw ProviderCastException(fmt::format("Provider '{}' does not implement the requested interface", Name));
      }
      return typed;
    }
  };
}

#endif
