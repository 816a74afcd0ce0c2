#ifndef AGENTMESH_REGISTRY_SERVICETYPE_HPP
#define AGENTMESH_REGISTRY_SERVICETYPE_HPP
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

#include <array>
#include <cstdint>
#include <string_view>

namespace AgentMesh
{
  /// @brief The kinds of service a provider can be registered for. Each has exactly one bus.
  enum class ServiceType : uint8_t
  {
    Communication,
    Tool,
    Llm,
    WiseAuthority,
    RuntimeControl,
  };

  inline constexpr std::array<ServiceType, 5> AllServiceTypes = {ServiceType::Communication, ServiceType::Tool, ServiceType::Llm,
                                                                  ServiceType::WiseAuthority, ServiceType::RuntimeControl};

  constexpr std::string_view ToString(const ServiceType type) noexcept
  {
    switch (type)
    {
    case ServiceType::Communication:
      return "communication";
    case ServiceType::Tool:
      return "tool";
    case ServiceType::Llm:
      return "llm";
    case ServiceType::WiseAuthority:
      return "wise_authority";
    case ServiceType::RuntimeControl:
      return "runtime_control";
    }
    return "unknown";
  }
}

#endif
