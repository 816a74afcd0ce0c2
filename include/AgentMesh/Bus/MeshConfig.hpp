#ifndef AGENTMESH_BUS_MESHCONFIG_HPP
#define AGENTMESH_BUS_MESHCONFIG_HPP
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

#include <AgentMesh/Bus/BusConfig.hpp>
#include <AgentMesh/Bus/ProviderInvoker.hpp>

namespace AgentMesh
{
  /// @brief Configuration of a BusManager and the buses it owns.
  struct MeshConfig
  {
    ProviderInvokerConfig Invoker;
    BusConfig Communication;
    BusConfig Tool;
    LlmBusConfig Llm;
    WiseBusConfig Wise;
    BusConfig RuntimeControl;

    void Validate() const
    {
      Invoker.Validate();
      Communication.Validate();
      Tool.Validate();
      Llm.Validate();
      Wise.Validate();
      RuntimeControl.Validate();
    }
  };
}

#endif
