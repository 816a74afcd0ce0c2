#ifndef AGENTMESH_BUS_PROVIDERSELECTOR_HPP
#define AGENTMESH_BUS_PROVIDERSELECTOR_HPP
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

#include <AgentMesh/Registry/ProviderRecord.hpp>
#include <AgentMesh/Registry/SelectionStrategy.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace AgentMesh
{
  /// @brief Providers tied on effective priority and priority group, in the order they should be tried.
  struct SelectionGroup
  {
    SelectionStrategy Strategy{SelectionStrategy::Fallback};
    std::vector<ProviderRecord> Members;
  };

  /// @brief Turns an ordered provider list into an attempt plan.
  ///
  /// The list returned by ServiceRegistry::GetProviders is split into tie groups. Inside each tie
  /// group the members are reordered by the group's strategy:
  ///   - Fallback keeps the registry order.
  ///   - RoundRobin rotates the group so the next member in turn comes first.
  ///   - LatencyBased puts unmeasured providers first, then the lowest average latency.
  /// The strategy of a group is the one declared by its first registered member unless overridden.
  class ProviderSelector
  {
    using GroupKey = std::pair<uint8_t, uint32_t>;

    std::mutex m_mutex;
    std::map<GroupKey, uint64_t> m_rotation;

  public:
    ProviderSelector() = default;

    ProviderSelector(const ProviderSelector&) = delete;
    ProviderSelector& operator=(const ProviderSelector&) = delete;

    /// @param ordered Providers in registry order.
    /// @param strategyOverride Strategy used for every group when set.
    std::vector<SelectionGroup> BuildPlan(std::vector<ProviderRecord> ordered, std::optional<SelectionStrategy> strategyOverride = std::nullopt);

    /// @brief Forgets the round robin positions.
    void Reset();

  private:
    void ApplyRoundRobin(SelectionGroup& group);
    static void ApplyLatencyOrder(SelectionGroup& group);
  };
}

#endif
