#ifndef AGENTMESH_REGISTRY_SERVICEPRIORITY_HPP
#define AGENTMESH_REGISTRY_SERVICEPRIORITY_HPP
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
  /// @brief Declared priority tier of a provider. Lower values are preferred.
  ///
  /// The numeric values are significant: domain routing promotes a provider by subtracting one
  /// from the value, and providers are ordered by the numeric value.
  enum class ServicePriority : uint8_t
  {
    Critical = 0,
    High = 1,
    Normal = 2,
    Low = 3,
    Fallback = 9,
  };

  constexpr uint8_t GetPriorityValue(const ServicePriority priority) noexcept
  {
    return static_cast<uint8_t>(priority);
  }

  constexpr std::string_view ToString(const ServicePriority priority) noexcept
  {
    switch (priority)
    {
    case ServicePriority::Critical:
      return "critical";
    case ServicePriority::High:
      return "high";
    case ServicePriority::Normal:
      return "normal";
    case ServicePriority::Low:
      return "low";
    case ServicePriority::Fallback:
      return "fallback";
    }
    return "unknown";
  }
}

#endif
