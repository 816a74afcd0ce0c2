#ifndef AGENTMESH_SERVICE_IWISEAUTHORITYSERVICE_HPP
#define AGENTMESH_SERVICE_IWISEAUTHORITYSERVICE_HPP
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

#include <AgentMesh/Service/IService.hpp>
#include <AgentMesh/Service/WiseAuthorityTypes.hpp>
#include <optional>
#include <stop_token>
#include <string>

namespace AgentMesh
{
  /// @brief Provider interface for wise authorities (human or automated oversight).
  class IWiseAuthorityService : public virtual IService
  {
  public:
    /// @return true if the authority acknowledged the deferral.
    virtual bool SendDeferral(const DeferralRequest& request, std::stop_token stopToken) = 0;

    /// @brief Single answer guidance.
    virtual std::optional<std::string> FetchGuidance(const GuidanceContext& context, std::stop_token stopToken) = 0;

    /// @brief Structured guidance used for fan-out and arbitration. nullopt means no opinion.
    virtual std::optional<GuidanceResponse> GetGuidance(const GuidanceRequest& request, std::stop_token stopToken) = 0;
  };
}

#endif
