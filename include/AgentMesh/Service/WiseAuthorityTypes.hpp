#ifndef AGENTMESH_SERVICE_WISEAUTHORITYTYPES_HPP
#define AGENTMESH_SERVICE_WISEAUTHORITYTYPES_HPP
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

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief What a handler knows when it decides to defer a thought to a wise authority.
  struct DeferralContext
  {
    std::string ThoughtId;
    std::string TaskId;
    std::string Reason;
    std::optional<std::chrono::system_clock::time_point> DeferUntil;
    std::optional<std::string> Priority;
    std::map<std::string, std::string> Metadata;
  };

  /// @brief The deferral as delivered to providers. DeferUntil is always resolved.
  struct DeferralRequest
  {
    std::string TaskId;
    std::string ThoughtId;
    std::string Reason;
    std::chrono::system_clock::time_point DeferUntil{};
    std::map<std::string, std::string> Context;
  };

  struct GuidanceContext
  {
    std::string ThoughtId;
    std::string TaskId;
    std::string Question;
    std::vector<std::string> EthicalConsiderations;
    std::map<std::string, std::string> DomainContext;
  };

  struct GuidanceRequest
  {
    std::string Context;
    std::vector<std::string> Options;
    /// @brief When set only providers declaring this capability are asked.
    std::optional<std::string> Capability;
    std::optional<std::string> Urgency;
  };

  /// @brief A single piece of advice from one provider.
  struct WisdomAdvice
  {
    std::string Capability;
    std::string ProviderName;
    std::string Explanation;
    std::optional<std::string> RiskLevel;
    std::optional<double> Confidence;
  };

  struct GuidanceResponse
  {
    std::optional<std::string> SelectedOption;
    std::optional<std::string> CustomGuidance;
    std::string Reasoning;
    std::string WaId;
    std::string Signature;
    std::optional<double> Confidence;
    std::vector<WisdomAdvice> Advice;
    /// @brief Set when the bus had to synthesize the response because no provider answered.
    bool Degraded{false};
  };
}

#endif
