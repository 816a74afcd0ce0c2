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

#include <AgentMesh/Bus/ProviderSelector.hpp>
#include <algorithm>
#include <cstddef>

namespace AgentMesh
{
  std::vector<SelectionGroup> ProviderSelector::BuildPlan(std::vector<ProviderRecord> ordered, const std::optional<SelectionStrategy> strategyOverride)
  {
    std::vector<SelectionGroup> plan;
    for (auto& record : ordered)
    {
      const bool newGroup = plan.empty() || plan.back().Members.front().EffectivePriority != record.EffectivePriority ||
                            plan.back().Members.front().PriorityGroup != record.PriorityGroup;
      if (newGroup)
      {
        plan.emplace_back();
      }
      plan.back().Members.push_back(std::move(record));
    }

    for (auto& group : plan)
    {
      if (strategyOverride.has_value())
      {
        group.Strategy = *strategyOverride;
      }
      else
      {
        const auto first = std::min_element(group.Members.begin(), group.Members.end(), [](const ProviderRecord& lhs, const ProviderRecord& rhs)
                                             { return lhs.RegistrationOrder < rhs.RegistrationOrder; });
        group.Strategy = first->Strategy;
      }

      if (group.Members.size() < 2)
      {
        continue;
      }

      switch (group.Strategy)
      {
      case SelectionStrategy::RoundRobin:
        ApplyRoundRobin(group);
        break;
      case SelectionStrategy::LatencyBased:
        ApplyLatencyOrder(group);
        break;
      case SelectionStrategy::Fallback:
        break;
      }
    }
    return plan;
  }

  void ProviderSelector::Reset()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rotation.clear();
  }

  void ProviderSelector::ApplyRoundRobin(SelectionGroup& group)
  {
    const auto& front = group.Members.front();
    const GroupKey key(front.EffectivePriority, front.PriorityGroup.GetValue());

    uint64_t counter = 0;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      counter = m_rotation[key]++;
    }

    const auto offset = static_cast<std::ptrdiff_t>(counter % group.Members.size());
    std::rotate(group.Members.begin(), group.Members.begin() + offset, group.Members.end());
  }

  void ProviderSelector::ApplyLatencyOrder(SelectionGroup& group)
  {
    // Stable, so equal latencies keep registration order
    std::stable_sort(group.Members.begin(), group.Members.end(),
                     [](const ProviderRecord& lhs, const ProviderRecord& rhs)
                     {
                       if (lhs.Metrics.HasLatency() != rhs.Metrics.HasLatency())
                       {
                         return !lhs.Metrics.HasLatency();
                       }
                       return lhs.Metrics.AverageLatencyMs < rhs.Metrics.AverageLatencyMs;
                     });
  }
}
