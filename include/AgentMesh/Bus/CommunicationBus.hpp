#ifndef AGENTMESH_BUS_COMMUNICATIONBUS_HPP
#define AGENTMESH_BUS_COMMUNICATIONBUS_HPP
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

#include <AgentMesh/Bus/BusBase.hpp>
#include <AgentMesh/Service/CommunicationTypes.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AgentMesh
{
  namespace CommunicationCapabilities
  {
    inline constexpr std::string_view SendMessage = "send_message";
    inline constexpr std::string_view FetchMessages = "fetch_messages";
  }

  /// @brief A message queued with CommunicationBus::SubmitMessage.
  struct SendMessageRequest : BusMessage
  {
    std::string ChannelId;
    std::string Content;
  };

  /// @brief Routes channel messages to communication providers.
  ///
  /// A provider declaring "channel_prefix" metadata only receives channels starting with that prefix.
  class CommunicationBus final : public BusBase
  {
    std::atomic<uint64_t> m_messagesSent{0};
    std::atomic<uint64_t> m_sendFailures{0};
    std::atomic<uint64_t> m_messagesFetched{0};

  public:
    CommunicationBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config = {});
    ~CommunicationBus() override;

    /// @brief Sends a message, falling back to the next provider on failure.
    /// @return false if no provider delivered the message.
    bool SendMessage(const std::string& channelId, const std::string& content, std::string_view handlerName);

    /// @brief Queues a message for delivery by the consumer thread.
    /// @return false if the bus dropped it.
    bool SubmitMessage(std::string channelId, std::string content, std::string handlerName);

    /// @return The messages, or an empty list if no provider could deliver them.
    std::vector<FetchedMessage> FetchMessages(const std::string& channelId, uint32_t limit, std::string_view handlerName);

    /// @brief The home channel of the highest priority provider that has one.
    std::optional<std::string> GetHomeChannel(std::string_view handlerName);

  protected:
    void ProcessMessage(BusMessage& message) override;
    void CollectMetrics(std::map<std::string, double>& rMetrics) const override;

  private:
    bool Deliver(const std::string& channelId, const std::string& content, std::string_view handlerName);
    std::vector<ProviderRecord> FindChannelProviders(const std::string& channelId, std::string_view capability);
  };
}

#endif
