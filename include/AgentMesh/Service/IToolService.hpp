#ifndef AGENTMESH_SERVICE_ITOOLSERVICE_HPP
#define AGENTMESH_SERVICE_ITOOLSERVICE_HPP
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
#include <AgentMesh/Service/ToolTypes.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief Provider interface for executing named tools.
  class IToolService : public virtual IService
  {
  public:
    virtual std::vector<std::string> GetAvailableTools() const = 0;

    virtual std::optional<ToolInfo> GetToolInfo(const std::string& toolName) const = 0;

    /// @brief Executes a tool.
    ///
    /// A result with status Failed is treated by the bus like a thrown exception: the failure is
    /// recorded and the next provider is tried.
    virtual ToolExecutionResult ExecuteTool(const std::string& toolName, const ToolParameters& parameters, std::stop_token stopToken) = 0;
  };
}

#endif
