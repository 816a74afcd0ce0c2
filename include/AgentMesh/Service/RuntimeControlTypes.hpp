#ifndef AGENTMESH_SERVICE_RUNTIMECONTROLTYPES_HPP
#define AGENTMESH_SERVICE_RUNTIMECONTROLTYPES_HPP
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

namespace AgentMesh
{
  struct ControlResponse
  {
    bool Success{false};
    std::string Message;
    std::string ProcessorState;
    std::optional<std::string> Error;
  };

  struct ProcessorQueueStatus
  {
    std::string ProcessorName;
    uint32_t QueueSize{0};
    uint32_t MaxSize{0};
  };

  struct RuntimeStatus
  {
    bool IsRunning{false};
    bool IsPaused{false};
    std::string ProcessorState;
    std::chrono::seconds Uptime{0};
  };
}

#endif
