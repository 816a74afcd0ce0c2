#ifndef AGENTMESH_REGISTRY_SERVICEPRIORITYGROUP_HPP
#define AGENTMESH_REGISTRY_SERVICEPRIORITYGROUP_HPP
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

#include <compare>
#include <cstdint>

namespace AgentMesh
{
  /// @brief Secondary ordering key among providers that share the same priority tier.
  ///
  /// Providers with the same priority and group form a tie group; the selection strategy is
  /// applied inside a tie group. Lower group values are tried first.
  class ServicePriorityGroup
  {
    uint32_t m_value{0};

  public:
    constexpr ServicePriorityGroup() noexcept = default;

    explicit constexpr ServicePriorityGroup(const uint32_t value) noexcept
      : m_value(value)
    {
    }

    [[nodiscard]] constexpr uint32_t GetValue() const noexcept
    {
      return m_value;
    }

    constexpr auto operator<=>(const ServicePriorityGroup& other) const noexcept = default;
    constexpr bool operator==(const ServicePriorityGroup& other) const noexcept = default;
  };
}

#endif
