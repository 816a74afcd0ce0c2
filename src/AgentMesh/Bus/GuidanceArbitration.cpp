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

#include <AgentMesh/Bus/GuidanceArbitration.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <utility>

namespace AgentMesh
{
  double GetEffectiveConfidence(const GuidanceResponse& response) noexcept
  {
    double confidence = response.Confidence.value_or(0.0);
    for (const auto& advice : response.Advice)
    {
      if (advice.Confidence.has_value())
      {
        confidence = std::max(confidence, *advice.Confidence);
      }
    }
    return confidence;
  }

  GuidanceResponse MakeDegradedGuidance(const char* customGuidance)
  {
    GuidanceResponse response;
    response.Reasoning = "No guidance available";
    response.WaId = "wisebus";
    response.Signature = "none";
    response.CustomGuidance = customGuidance;
    response.Degraded = true;
    return response;
  }

  GuidanceResponse ArbitrateGuidance(std::vector<GuidanceCandidate> candidates)
  {
    if (candidates.empty())
    {
      return MakeDegradedGuidance("No providers responded");
    }
    if (candidates.size() == 1)
    {
      return std::move(candidates.front().Response);
    }

    const auto best = std::min_element(candidates.begin(), candidates.end(),
                                       [](const GuidanceCandidate& lhs, const GuidanceCandidate& rhs)
                                       {
                                         const double lhsConfidence = GetEffectiveConfidence(lhs.Response);
                                         const double rhsConfidence = GetEffectiveConfidence(rhs.Response);
                                         if (lhsConfidence != rhsConfidence)
                                         {
                                           return lhsConfidence > rhsConfidence;
                                         }
                                         return lhs.Sequence < rhs.Sequence;
                                       });

    const double bestConfidence = GetEffectiveConfidence(best->Response);
    std::vector<WisdomAdvice> allAdvice;
    for (const auto& candidate : candidates)
    {
      allAdvice.insert(allAdvice.end(), candidate.Response.Advice.begin(), candidate.Response.Advice.end());
    }

    GuidanceResponse result = std::move(best->Response);
    result.Advice = std::move(allAdvice);
    result.Reasoning = fmt::format("{} (selected with {:.2f} confidence from {} providers)", result.Reasoning, bestConfidence, candidates.size());
    return result;
  }
}
