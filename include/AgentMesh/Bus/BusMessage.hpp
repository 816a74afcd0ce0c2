#ifndef AGENTMESH_BUS_BUSMESSAGE_HPP
#define AGENTMESH_BUS_BUSMESSAGE_HPP
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

#include <optional>
#include <string>
#include <utility>

namespace AgentMesh
{
  /// @brief Base of every message queued on a bus. Buses derive their payload types from it.
  struct BusMessage
  {
    /// @brief Name of the handler that submitted the message.
    std::string HandlerName;
    /// @brief Assigned by the bus on submission if left empty.
    std::string CorrelationId;
    std::optional<std::string> RequiredCapability;
    std::optional<std::string> Domain;

    BusMessage() = default;
    explicit BusMessage(std::string handlerName)
      : HandlerName(std::move(handlerName))
    {
    }
    virtual ~BusMessage() = default;

    BusMessage(const BusMessage&) = default;
    BusMessage& operator=(const BusMessage&) = default;
    BusMessage(BusMessage&&) = default;
    BusMessage& operator=(BusMessage&&) = default;
  };
}

#endif
