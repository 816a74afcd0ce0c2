#ifndef AGENTMESH_SERVICE_LLMTYPES_HPP
#define AGENTMESH_SERVICE_LLMTYPES_HPP
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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace AgentMesh
{
  struct LlmMessage
  {
    std::string Role;
    std::string Content;
  };

  struct LlmRequest
  {
    std::vector<LlmMessage> Messages;
    /// @brief Preferred model, the provider decides if unset.
    std::optional<std::string> Model;
    uint32_t MaxTokens{1024};
    double Temperature{0.0};
    /// @brief Routing domain (for example "medical" or "legal"). Unset means every provider is eligible.
    std::optional<std::string> Domain;
  };

  struct LlmUsage
  {
    uint32_t InputTokens{0};
    uint32_t OutputTokens{0};
    double CostCents{0.0};
  };

  struct LlmResult
  {
    std::string Content;
    std::string Model;
    /// @brief Filled in by the bus with the name of the provider that answered.
    std::string ProviderName;
    LlmUsage Usage;
    std::chrono::milliseconds Latency{0};
  };
}

#endif
