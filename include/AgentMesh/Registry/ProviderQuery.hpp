#ifndef AGENTMESH_REGISTRY_PROVIDERQUERY_HPP
#define AGENTMESH_REGISTRY_PROVIDERQUERY_HPP
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

#include <AgentMesh/Registry/ServiceType.hpp>
#include <optional>
#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief Filter used by ServiceRegistry::GetProviders.
  struct ProviderQuery
  {
    ServiceType Type{ServiceType::Communication};

    /// @brief A provider matches if it declares every one of these.
    std::vector<std::string> RequiredCapabilities;

    /// @brief Only providers of this domain or the general domain match. Exact matches are promoted one tier.
    std::optional<std::string> Domain;

    /// @brief Also return providers whose breaker is open. Buses then skip their health checks too.
    bool IncludeUnavailable{false};
  };
}

#endif
