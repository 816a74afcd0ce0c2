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

#include <AgentMesh/Bus/CommunicationBus.hpp>
#include <AgentMesh/Service/ICommunicationService.hpp>
#include <algorithm>
#include <memory>
#include <typeinfo>
#include <utility>

namespace AgentMesh
{
  CommunicationBus::CommunicationBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config)
    : BusBase(ServiceType::Communication, registry, invoker, config)
  {
  }

  CommunicationBus::~CommunicationBus()
  {
    Stop();
  }

  bool CommunicationBus::SendMessage(const std::string& channelId, const std::string& content, const std::string_view handlerName)
  {
    EnsureRunning("CommunicationBus::SendMessage");
    return Deliver(channelId, content, handlerName);
  }

  bool CommunicationBus::SubmitMessage(std::string channelId, std::string content, std::string handlerName)
  {
    auto message = std::make_unique<SendMessageRequest>();
    message->HandlerName = std::move(handlerName);
    message->ChannelId = std::move(channelId);
    message->Content = std::move(content);
    message->RequiredCapability = std::string(CommunicationCapabilities::SendMessage);
    return TryEnqueue(std::move(message));
  }

  std::vector<FetchedMessage> CommunicationBus::FetchMessages(const std::string& channelId, const uint32_t limit, const std::string_view handlerName)
  {
    EnsureRunning("CommunicationBus::FetchMessages");

    auto candidates = FindChannelProviders(channelId, CommunicationCapabilities::FetchMessages);
    if (candidates.empty())
    {
      GetLogger()->debug("FetchMessages: no provider for channel '{}' (handler '{}')", channelId, handlerName);
      return {};
    }

    try
    {
      auto messages = TryExecute<std::vector<FetchedMessage>>(std::move(candidates), "FetchMessages",
                                                              [this, &channelId, limit](const ProviderRecord& record)
                                                              {
                                                                auto service = record.GetInstance<ICommunicationService>();
                                                                return InvokeProvider<std::vector<FetchedMessage>>(
                                                                  record, [service, channelId, limit](std::stop_token stopToken)
                                                                  { return service->FetchMessages(channelId, limit, stopToken); });
                                                              });
      if (!messages.has_value())
      {
        return {};
      }
      m_messagesFetched += messages->size();
      return std::move(*messages);
    }
    catch (const OperationFailedException& ex)
    {
      GetLogger()->error("FetchMessages: channel '{}' for '{}' failed: {}", channelId, handlerName, ex.what());
      return {};
    }
  }

  std::optional<std::string> CommunicationBus::GetHomeChannel(const std::string_view handlerName)
  {
    for (const auto& record : FindProviders(ProviderQuery{}, ProviderLookup::Listing))
    {
      std::shared_ptr<ICommunicationService> service;
      try
      {
        service = record.GetInstance<ICommunicationService>();
      }
      catch (const ProviderCastException& ex)
      {
        GetLogger()->error("GetHomeChannel: {}", ex.what());
        continue;
      }
      auto homeChannel = QueryProvider<std::optional<std::string>>(record, "GetHomeChannel",
                                                                   [service](std::stop_token /*stopToken*/) { return service->GetHomeChannelId(); });
      if (homeChannel.has_value() && homeChannel->has_value() && !(*homeChannel)->empty())
      {
        return *homeChannel;
      }
    }
    GetLogger()->debug("GetHomeChannel: no provider has a home channel (handler '{}')", handlerName);
    return std::nullopt;
  }

  void CommunicationBus::ProcessMessage(BusMessage& message)
  {
    auto* request = dynamic_cast<SendMessageRequest*>(&message);
    if (request == nullptr)
    {
      throw std::invalid_argument(fmt::format("CommunicationBus: unsupported message type '{}'", typeid(message).name()));
    }
    if (!Deliver(request->ChannelId, request->Content, request->HandlerName))
    {
      throw OperationFailedException(fmt::format("Message {} to channel '{}' was not delivered", request->CorrelationId, request->ChannelId));
    }
  }

  void CommunicationBus::CollectMetrics(std::map<std::string, double>& rMetrics) const
  {
    rMetrics["messages_sent"] = static_cast<double>(m_messagesSent.load());
    rMetrics["send_failures"] = static_cast<double>(m_sendFailures.load());
    rMetrics["messages_fetched"] = static_cast<double>(m_messagesFetched.load());
  }

  bool CommunicationBus::Deliver(const std::string& channelId, const std::string& content, const std::string_view handlerName)
  {
    auto candidates = FindChannelProviders(channelId, CommunicationCapabilities::SendMessage);
    if (candidates.empty())
    {
      GetLogger()->warn("SendMessage: no communication provider for channel '{}' (handler '{}')", channelId, handlerName);
      ++m_sendFailures;
      return false;
    }

    try
    {
      const auto sent = TryExecute<bool>(std::move(candidates), "SendMessage",
                                         [this, &channelId, &content](const ProviderRecord& record)
                                         {
                                           auto service = record.GetInstance<ICommunicationService>();
                                           return InvokeProvider<bool>(record,
                                                                       [service, channelId, content, name = record.Name](std::stop_token stopToken)
                                                                       {
                                                                         if (!service->SendMessage(channelId, content, stopToken))
                                                                         {
                                                                           throw OperationFailedException(
                                                                             fmt::format("Provider '{}' did not deliver the message", name));
                                                                         }
                                                                         return true;
                                                                       });
                                         });
      if (sent.value_or(false))
      {
        ++m_messagesSent;
        return true;
      }
    }
    catch (const OperationFailedException& ex)
    {
      GetLogger()->error("SendMessage: channel '{}' for '{}' failed: {}", channelId, handlerName, ex.what());
    }
    ++m_sendFailures;
    return false;
  }

  std::vector<ProviderRecord> CommunicationBus::FindChannelProviders(const std::string& channelId, const std::string_view capability)
  {
    ProviderQuery query;
    query.RequiredCapabilities.emplace_back(capability);
    auto providers = FindProviders(std::move(query));
    std::erase_if(providers,
                  [&channelId](const ProviderRecord& record)
                  {
                    const auto prefix = GetMetadataValue(record.Metadata, MetadataKeys::ChannelPrefix, "");
                    return !prefix.empty() && !std::string_view(channelId).starts_with(prefix);
                  });
    return providers;
  }
}
