#ifndef AGENTMESH_REGISTRY_SERVICEREGISTRATION_HPP
#define AGENTMESH_REGISTRY_SERVICEREGISTRATION_HPP
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
#include <AgentMesh/Registry/SelectionStrategy.hpp>
#include <AgentMesh/Registry/ServicePriority.hpp>
#include <AgentMesh/Registry/ServicePriorityGroup.hpp>
#include <AgentMesh/Registry/ServiceType.hpp>
#include <AgentMesh/Resilience/CircuitBreakerConfig.hpp>
#include <memory>
#include <string>
#include <vector>

namespace AgentMesh
{
  class IService;

  /// @brief Everything the registry needs to know about a provider.
  struct ServiceRegistration
  {
    ServiceType Type{ServiceType::Communication};
    std::shared_ptr<IService> Provider;

    /// @brief Registered name, unique per service type. Empty means IService::GetName().
    std::string Name;

    ServicePriority Priority{ServicePriority::Normal};
    ServicePriorityGroup PriorityGroup;

    /// @brief Declared capabilities. Empty means IService::GetCapabilities().
    std::vector<std::string> Capabilities;

    SelectionStrategy Strategy{SelectionStrategy::Fallback};
    ProviderMetadata Metadata;
    CircuitBreakerConfig BreakerConfig;
  };
}

#endif
