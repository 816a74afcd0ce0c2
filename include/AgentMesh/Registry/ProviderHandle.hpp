#ifndef AGENTMESH_REGISTRY_PROVIDERHANDLE_HPP
#define AGENTMESH_REGISTRY_PROVIDERHANDLE_HPP
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
#include <compare>
#include <cstdint>

namespace AgentMesh
{
  /// @brief Opaque identifier returned by ServiceRegistry::Register.
  ///
  /// Ids are never reused within a registry, so a handle to an unregistered provider stays invalid
  /// even if a provider with the same name is registered again.
  class ProviderHandle
  {
    ServiceType m_type{ServiceType::Communication};
    uint64_t m_id{0};

  public:
    constexpr ProviderHandle() noexcept = default;

    constexpr ProviderHandle(const ServiceType type, const uint64_t id) noexcept
      : m_type(type)
      , m_id(id)
    {
    }

    [[nodiscard]] constexpr ServiceType GetServiceType() const noexcept
    {
      return m_type;
    }

    [[nodiscard]] constexpr uint64_t GetId() const noexcept
    {
      return m_id;
    }

    /// @brief A default constructed handle refers to nothing.
    [[nodiscard]] constexpr bool IsValid() const noexcept
    {
      return m_id != 0;
    }

    constexpr auto operator<=>(const ProviderHandle& other) const noexcept = default;
    constexpr bool operator==(const ProviderHandle& other) const noexcept = default;
  };
}

#endif
