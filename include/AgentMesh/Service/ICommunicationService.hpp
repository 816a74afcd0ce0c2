#ifndef AGENTMESH_SERVICE_ICOMMUNICATIONSERVICE_HPP
#define AGENTMESH_SERVICE_ICOMMUNICATIONSERVICE_HPP
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

#include <AgentMesh/Service/CommunicationTypes.hpp>
#include <AgentMesh/Service/IService.hpp>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief Provider interface for sending and reading channel messages.
  class ICommunicationService : public virtual IService
  {
  public:
    /// @brief Sends a message to a channel.
    /// @return true if the message was delivered.
    virtual bool SendMessage(const std::string& channelId, const std::string& content, std::stop_token stopToken) = 0;

    /// @brief Fetches up to limit of the most recent messages of a channel.
    virtual std::vector<FetchedMessage> FetchMessages(const std::string& channelId, uint32_t limit, std::stop_token stopToken) = 0;

    /// @brief The channel the provider considers its home, if any.
    virtual std::optional<std::string> GetHomeChannelId() const
    {
      return std::nullopt;
    }
  };
}

#endif
