#ifndef AGENTMESH_BUS_BUSCONFIG_HPP
#define AGENTMESH_BUS_BUSCONFIG_HPP
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

#include <AgentMesh/Registry/SelectionStrategy.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace AgentMesh
{
  /// @brief Settings shared by every bus.
  struct BusConfig
  {
    /// @brief Maximum number of queued messages, submissions beyond this are dropped.
    std::size_t QueueCapacity{1000};

    /// @brief How long Stop waits for queued messages before abandoning them.
    std::chrono::milliseconds DrainTimeout{std::chrono::seconds(5)};

    /// @brief Upper bound of a single provider call.
    std::chrono::milliseconds CallTimeout{std::chrono::seconds(30)};

    /// @brief Replaces the strategy declared by the providers when set.
    std::optional<SelectionStrategy> StrategyOverride;

    void Validate() const
    {
      if (QueueCapacity == 0)
      {
        throw std::invalid_argument("BusConfig: QueueCapacity must be at least 1");
      }
      if (DrainTimeout.count() < 0)
      {
        throw std::invalid_argument(fmt::format("BusConfig: DrainTimeout can not be negative ({}ms)", DrainTimeout.count()));
      }
      if (CallTimeout.count() <= 0)
      {
        throw std::invalid_argument(fmt::format("BusConfig: CallTimeout must be positive ({}ms)", CallTimeout.count()));
      }
    }
  };

  struct LlmBusConfig : BusConfig
  {
    /// @brief Cooldown applied to a rate limited provider that gave no retry hint.
    std::chrono::milliseconds RateLimitCooldown{std::chrono::seconds(60)};

    LlmBusConfig()
    {
      StrategyOverride = SelectionStrategy::LatencyBased;
    }

    void Validate() const
    {
      BusConfig::Validate();
      if (RateLimitCooldown.count() < 0)
      {
        throw std::invalid_argument(fmt::format("LlmBusConfig: RateLimitCooldown can not be negative ({}ms)", RateLimitCooldown.count()));
      }
    }
  };

  struct WiseBusConfig : BusConfig
  {
    /// @brief Default overall bound of a guidance fan-out.
    std::chrono::milliseconds GuidanceTimeout{std::chrono::seconds(5)};

    /// @brief Overall bound of a deferral broadcast.
    std::chrono::milliseconds DeferralTimeout{std::chrono::seconds(5)};

    /// @brief Maximum number of providers asked for guidance.
    uint32_t MaxGuidanceFanOut{5};

    void Validate() const
    {
      BusConfig::Validate();
      if (GuidanceTimeout.count() <= 0 || DeferralTimeout.count() <= 0)
      {
        throw std::invalid_argument("WiseBusConfig: GuidanceTimeout and DeferralTimeout must be positive");
      }
      if (MaxGuidanceFanOut == 0)
      {
        throw std::invalid_argument("WiseBusConfig: MaxGuidanceFanOut must be at least 1");
      }
    }
  };
}

#endif
