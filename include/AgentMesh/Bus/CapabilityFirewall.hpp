#ifndef AGENTMESH_BUS_CAPABILITYFIREWALL_HPP
#define AGENTMESH_BUS_CAPABILITYFIREWALL_HPP
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

#include <AgentMesh/Log/AuditLog.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace AgentMesh
{
  /// @brief Hard rejection of capability tags from prohibited domains.
  ///
  /// A capability is prohibited if it contains any of the compiled in terms, compared case
  /// insensitively. The list can not be changed at runtime. Every rejection is audited.
  class CapabilityFirewall
  {
    std::shared_ptr<AuditLog> m_auditLog;
    std::atomic<uint64_t> m_rejections{0};

  public:
    explicit CapabilityFirewall(std::shared_ptr<AuditLog> auditLog);

    CapabilityFirewall(const CapabilityFirewall&) = delete;
    CapabilityFirewall& operator=(const CapabilityFirewall&) = delete;

    /// @brief Checks a capability. An unset or empty capability always passes.
    /// @throws CapabilityProhibitedException if the capability contains a prohibited term.
    void Enforce(const std::optional<std::string>& capability);

    [[nodiscard]] uint64_t GetRejectionCount() const noexcept
    {
      return m_rejections.load();
    }

    /// @brief Finds the first prohibited term contained in the capability.
    static std::optional<std::string_view> FindProhibitedTerm(std::string_view capability);

    static std::span<const std::string_view> GetProhibitedTerms() noexcept;
  };
}

#endif
