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

#include <AgentMesh/Bus/GuidanceArbitration.hpp>
#include <AgentMesh/Bus/WiseBus.hpp>
#include <AgentMesh/Log/AuditLog.hpp>
#include <AgentMesh/Service/IWiseAuthorityService.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <typeinfo>
#include <utility>
#include <vector>

namespace AgentMesh
{
  WiseBus::WiseBus(ServiceRegistry& registry, ProviderInvoker& invoker, const WiseBusConfig& config)
    : BusBase(ServiceType::WiseAuthority, registry, invoker, config)
    , m_wiseConfig(config)
    , m_firewall(registry.GetAuditLog())
  {
    m_wiseConfig.Validate();
  }

  WiseBus::~WiseBus()
  {
    Stop();
  }

  bool WiseBus::SendDeferral(const DeferralContext& context, const std::string_view handlerName)
  {
    EnsureRunning("WiseBus::SendDeferral");
    return BroadcastDeferral(context, handlerName);
  }

  bool WiseBus::SubmitDeferral(DeferralContext context, std::string handlerName)
  {
    auto message = std::make_unique<DeferralMessage>();
    message->HandlerName = std::move(handlerName);
    message->RequiredCapability = std::string(WiseAuthorityCapabilities::SendDeferral);
    message->Context = std::move(context);
    return TryEnqueue(std::move(message));
  }

  bool WiseBus::RequestReview(const std::string& reviewType, const std::map<std::string, std::string>& reviewData, const std::string_view handlerName)
  {
    DeferralContext context;
    context.ThoughtId = fmt::format("review_{}_{}", reviewType, handlerName);
    context.TaskId = fmt::format("review_task_{}", reviewType);
    context.Reason = fmt::format("Review requested: {}", reviewType);
    context.Metadata = reviewData;
    context.Metadata["handler_name"] = std::string(handlerName);
    return SendDeferral(context, handlerName);
  }

  GuidanceResponse WiseBus::RequestGuidance(const GuidanceRequest& request, const std::optional<std::chrono::milliseconds> timeout)
  {
    // Prohibited domains are rejected before anything else, even when no authority is registered
    m_firewall.Enforce(request.Capability);
    EnsureRunning("WiseBus::RequestGuidance");
    ++m_guidanceRequests;

    ProviderQuery query;
    if (request.Capability.has_value() && !request.Capability->empty())
    {
      query.RequiredCapabilities.push_back(*request.Capability);
    }
    auto providers = FindProviders(std::move(query));
    if (providers.size() > m_wiseConfig.MaxGuidanceFanOut)
    {
      providers.resize(m_wiseConfig.MaxGuidanceFanOut);
    }

    if (providers.empty())
    {
      GetLogger()->warn("RequestGuidance: no wise authority available for capability '{}'", request.Capability.value_or(""));
      ++m_degradedResponses;
      return MakeDegradedGuidance("No providers available");
    }

    const auto bound = timeout.value_or(m_wiseConfig.GuidanceTimeout);
    auto outcomes = FanOut<std::optional<GuidanceResponse>>(providers,
                                                            [&request](const ProviderRecord& record)
                                                            {
                                                              auto service = record.GetInstance<IWiseAuthorityService>();
                                                              return [service, request](std::stop_token stopToken)
                                                              { return service->GetGuidance(request, stopToken); };
                                                            },
                                                            bound);

    std::vector<GuidanceCandidate> candidates;
    for (auto& outcome : outcomes)
    {
      if (outcome.Value.has_value() && outcome.Value->has_value())
      {
        candidates.push_back(GuidanceCandidate{std::move(**outcome.Value), outcome.Sequence});
      }
    }
    GetLogger()->debug("RequestGuidance: {} of {} authorities answered within {}ms", candidates.size(), outcomes.size(), bound.count());

    auto response = ArbitrateGuidance(std::move(candidates));
    if (response.Degraded)
    {
      ++m_degradedResponses;
    }
    return response;
  }

  std::optional<std::string> WiseBus::FetchGuidance(const GuidanceContext& context, const std::string_view handlerName)
  {
    EnsureRunning("WiseBus::FetchGuidance");

    ProviderQuery query;
    query.RequiredCapabilities.emplace_back(WiseAuthorityCapabilities::FetchGuidance);
    auto candidates = FindProviders(std::move(query));
    if (candidates.empty())
    {
      GetLogger()->debug("FetchGuidance: no wise authority available for '{}'", handlerName);
      return std::nullopt;
    }

    try
    {
      auto guidance = TryExecute<std::optional<std::string>>(std::move(candidates), "FetchGuidance",
                                                             [this, &context](const ProviderRecord& record)
                                                             {
                                                               auto service = record.GetInstance<IWiseAuthorityService>();
                                                               return InvokeProvider<std::optional<std::string>>(
                                                                 record, [service, context](std::stop_token stopToken)
                                                                 { return service->FetchGuidance(context, stopToken); });
                                                             });
      if (!guidance.has_value())
      {
        return std::nullopt;
      }
      return std::move(*guidance);
    }
    catch (const OperationFailedException& ex)
    {
      GetLogger()->error("FetchGuidance: failed for '{}': {}", handlerName, ex.what());
      return std::nullopt;
    }
  }

  void WiseBus::ProcessMessage(BusMessage& message)
  {
    auto* deferral = dynamic_cast<DeferralMessage*>(&message);
    if (deferral == nullptr)
    {
      throw std::invalid_argument(fmt::format("WiseBus: unsupported message type '{}'", typeid(message).name()));
    }
    if (!BroadcastDeferral(deferral->Context, deferral->HandlerName))
    {
      throw OperationFailedException(fmt::format("Deferral {} of thought '{}' was not acknowledged", deferral->CorrelationId, deferral->Context.ThoughtId));
    }
  }

  void WiseBus::CollectMetrics(std::map<std::string, double>& rMetrics) const
  {
    rMetrics["deferrals_sent"] = static_cast<double>(m_deferralsSent.load());
    rMetrics["deferrals_undelivered"] = static_cast<double>(m_deferralsUndelivered.load());
    rMetrics["guidance_requests"] = static_cast<double>(m_guidanceRequests.load());
    rMetrics["degraded_responses"] = static_cast<double>(m_degradedResponses.load());
    rMetrics["prohibited_rejections"] = static_cast<double>(m_firewall.GetRejectionCount());
  }

  bool WiseBus::BroadcastDeferral(const DeferralContext& context, const std::string_view handlerName)
  {
    ProviderQuery query;
    query.RequiredCapabilities.emplace_back(WiseAuthorityCapabilities::SendDeferral);
    const auto providers = FindProviders(std::move(query));
    if (providers.empty())
    {
      GetLogger()->info("SendDeferral: no wise authority accepts deferrals (handler '{}')", handlerName);
      ++m_deferralsUndelivered;
      return false;
    }

    DeferralRequest request;
    request.TaskId = context.TaskId;
    request.ThoughtId = context.ThoughtId;
    request.Reason = context.Reason;
    request.DeferUntil = context.DeferUntil.value_or(std::chrono::system_clock::now() + std::chrono::hours(1));
    request.Context = context.Metadata;
    if (context.Priority.has_value())
    {
      request.Context["priority"] = *context.Priority;
    }

    GetLogger()->info("SendDeferral: broadcasting thought '{}' to {} wise authorities", context.ThoughtId, providers.size());
    const auto outcomes = FanOut<bool>(providers,
                                       [&request](const ProviderRecord& record)
                                       {
                                         auto service = record.GetInstance<IWiseAuthorityService>();
                                         return [service, request](std::stop_token stopToken) { return service->SendDeferral(request, stopToken); };
                                       },
                                       m_wiseConfig.DeferralTimeout);

    const auto acknowledged = std::count_if(outcomes.begin(), outcomes.end(), [](const auto& outcome) { return outcome.Value.value_or(false); });

    AuditEvent event;
    event.Type = AuditEventType::DeferralBroadcast;
    event.Subject = context.ThoughtId;
    event.Detail = fmt::format("task='{}' handler='{}' acknowledged={}/{} reason='{}'", context.TaskId, handlerName, acknowledged, providers.size(),
                               context.Reason);
    m_registry.GetAuditLog()->Record(std::move(event));

    if (acknowledged == 0)
    {
      GetLogger()->warn("SendDeferral: no wise authority acknowledged thought '{}'", context.ThoughtId);
      ++m_deferralsUndelivered;
      return false;
    }
    ++m_deferralsSent;
    return true;
  }
}
