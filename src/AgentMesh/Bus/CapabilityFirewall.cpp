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

#include <AgentMesh/Bus/CapabilityFirewall.hpp>
#include <AgentMesh/Exception/CapabilityProhibitedException.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace AgentMesh
{
  namespace
  {
    constexpr std::array<std::string_view, 30> ProhibitedTerms = {
      "domain:medical",   "domain:health",    "domain:triage",    "domain:diagnosis", "domain:treatment", "domain:prescription",
      "domain:patient",   "domain:clinical",  "domain:symptom",   "domain:disease",   "domain:medication", "domain:therapy",
      "domain:condition", "domain:disorder",  "modality:medical", "provider:medical", "clinical",          "symptom",
      "disease",          "medication",       "therapy",          "triage",           "diagnosis",        "treatment",
      "prescription",     "patient",          "health",           "medical",          "condition",        "disorder",
    };

    std::string ToLower(const std::string_view value)
    {
      std::string result(value);
      std::transform(result.begin(), result.end(), result.begin(), [](const unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
      return result;
    }
  }

  CapabilityFirewall::CapabilityFirewall(std::shared_ptr<AuditLog> auditLog)
    : m_auditLog(std::move(auditLog))
  {
    if (!m_auditLog)
    {
      throw std::invalid_argument("CapabilityFirewall: audit log can not be null");
    }
  }

  void CapabilityFirewall::Enforce(const std::optional<std::string>& capability)
  {
    if (!capability.has_value() || capability->empty())
    {
      return;
    }

    const auto term = FindProhibitedTerm(*capability);
    if (!term.has_value())
    {
      return;
    }

    ++m_rejections;
    AuditEvent event;
    event.Type = AuditEventType::CapabilityProhibited;
    event.Subject = *capability;
    event.Detail = fmt::format("matched prohibited term '{}'", *term);
    m_auditLog->Record(std::move(event));

    throw CapabilityProhibitedException(
      fmt::format("Capability '{}' contains prohibited term '{}'. Requests in this domain are not routed", *capability, *term));
  }

  std::optional<std::string_view> CapabilityFirewall::FindProhibitedTerm(const std::string_view capability)
  {
    const std::string lowered = ToLower(capability);
    for (const auto term : ProhibitedTerms)
    {
      if (lowered.find(term) != std::string::npos)
      {
        return term;
      }
    }
    return std::nullopt;
  }

  std::span<const std::string_view> CapabilityFirewall::GetProhibitedTerms() noexcept
  {
    return ProhibitedTerms;
  }
}
