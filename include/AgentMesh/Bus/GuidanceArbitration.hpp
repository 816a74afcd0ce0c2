#ifndef AGENTMESH_BUS_GUIDANCEARBITRATION_HPP
#define AGENTMESH_BUS_GUIDANCEARBITRATION_HPP
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

#include <AgentMesh/Service/WiseAuthorityTypes.hpp>
#include <cstdint>
#include <vector>

namespace AgentMesh
{
  /// @brief A guidance response and the order in which it arrived.
  struct GuidanceCandidate
  {
    GuidanceResponse Response;
    uint64_t Sequence{0};
  };

  /// @brief The highest of the response confidence and the confidences of its advice. Zero if none is set.
  double GetEffectiveConfidence(const GuidanceResponse& response) noexcept;

  /// @brief The response returned when no provider could be asked or none answered.
  GuidanceResponse MakeDegradedGuidance(const char* customGuidance);

  /// @brief Picks the response with the highest effective confidence.
  ///
  /// Ties go to the response that arrived first. With more than one candidate the winner receives
  /// the advice of every candidate and its reasoning is annotated with the selection. A single
  /// candidate is returned unchanged, no candidates give a degraded response.
  GuidanceResponse ArbitrateGuidance(std::vector<GuidanceCandidate> candidates);
}

#endif
