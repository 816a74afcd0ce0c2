#ifndef AGENTMESH_SERVICE_IRUNTIMECONTROLSERVICE_HPP
#define AGENTMESH_SERVICE_IRUNTIMECONTROLSERVICE_HPP
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
#include <AgentMesh/Service/RuntimeControlTypes.hpp>
#include <stop_token>
#include <string>

namespace AgentMesh
{
  /// @brief Provider interface for controlling the agent's processing loop.
  class IRuntimeControlService : public virtual IService
  {
  public:
    virtual ControlResponse PauseProcessing(std::stop_token stopToken) = 0;
    virtual ControlResponse ResumeProcessing(std::stop_token stopToken) = 0;
    virtual ControlResponse SingleStep(std::stop_token stopToken) = 0;
    virtual ProcessorQueueStatus GetProcessorQueueStatus(std::stop_token stopToken) = 0;
    virtual RuntimeStatus GetRuntimeStatus(std::stop_token stopToken) = 0;
    virtual ControlResponse Shutdown(const std::string& reason, std::stop_token stopToken) = 0;
  };
}

#endif
