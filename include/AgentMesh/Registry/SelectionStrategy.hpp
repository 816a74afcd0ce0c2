#ifndef AGENTMESH_REGISTRY_SELECTIONSTRATEGY_HPP
#define AGENTMESH_REGISTRY_SELECTIONSTRATEGY_HPP
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

#include <cstdint>
#include <string_view>

namespace AgentMesh
{
  /// @brief How a bus picks among providers tied on priority and group.
  enum class SelectionStrategy : uint8_t
  {
    /// @brief Try in order, on failure move to the next provider.
    Fallback,
    /// @brief Rotate through the tied providers, one attempt per tie group.
    RoundRobin,
    /// @brief Prefer the lowest average latency, one attempt per tie group.
    LatencyBased,
  };

  constexpr std::string_view ToString(const SelectionStrategy strategy) noexcept
  {
    switch (strategy)
    {
    case SelectionStrategy::Fallback:
      return "fallback";
    case SelectionStrategy::RoundRobin:
      return "round_robin";
    case SelectionStrategy::LatencyBased:
      return "latency_based";
    }
    return "unknown";
  }
}

#endif
