#ifndef AGENTMESH_SERVICE_TOOLTYPES_HPP
#define AGENTMESH_SERVICE_TOOLTYPES_HPP
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

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace AgentMesh
{
  using ToolParameters = std::map<std::string, std::string>;

  /// @brief Describes a tool offered by a provider.
  struct ToolInfo
  {
    std::string Name;
    std::string Description;
    /// @brief Parameter name to a human readable description of the expected value.
    std::map<std::string, std::string> Parameters;
    std::string Category{"general"};
  };

  enum class ToolExecutionStatus : uint8_t
  {
    Completed,
    Failed,
    NotFound,
    Timeout,
    Unauthorized,
  };

  constexpr std::string_view ToString(const ToolExecutionStatus status) noexcept
  {
    switch (status)
    {
    case ToolExecutionStatus::Completed:
      return "completed";
    case ToolExecutionStatus::Failed:
      return "failed";
    case ToolExecutionStatus::NotFound:
      return "not_found";
    case ToolExecutionStatus::Timeout:
      return "timeout";
    case ToolExecutionStatus::Unauthorized:
      return "unauthorized";
    }
    return "unknown";
  }

  struct ToolExecutionResult
  {
    std::string ToolName;
    ToolExecutionStatus Status{ToolExecutionStatus::Failed};
    bool Success{false};
    std::string Output;
    std::optional<std::string> Error;
    /// @brief Name of the provider that produced the result. Empty if no provider was invoked.
    std::string ProviderName;
    std::string CorrelationId;
  };
}

#endif
