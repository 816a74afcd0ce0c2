#ifndef AGENTMESH_BUS_BUSSTATS_HPP
#define AGENTMESH_BUS_BUSSTATS_HPP
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

#include <AgentMesh/Registry/ServiceType.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace AgentMesh
{
  struct BusStats
  {
    ServiceType Type{ServiceType::Communication};
    /// @brief Messages queued or being processed.
    std::size_t QueueSize{0};
    uint64_t Processed{0};
    uint64_t Failed{0};
    uint64_t Dropped{0};
    bool Running{false};
    /// @brief Bus specific counters.
    std::map<std::string, double> Metrics;
  };
}

#endif
