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

#include <AgentMesh/Bus/RuntimeControlBus.hpp>
#include <AgentMesh/Log/AuditLog.hpp>
#include <AgentMesh/Service/IRuntimeControlService.hpp>
#include <fmt/format.h>
#include <typeinfo>
#include <utility>

namespace AgentMesh
{
  namespace
  {
    ControlResponse MakeFailure(std::string message, std::string error, std::string processorState = "unknown")
    {
      ControlResponse response;
      response.Success = false;
      response.Message = std::move(message);
      response.ProcessorState = std::move(processorState);
      response.Error = std::move(error);
      return response;
    }
  }

  RuntimeControlBus::RuntimeControlBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config)
    : BusBase(ServiceType::RuntimeControl, registry, invoker, config)
  {
  }

  RuntimeControlBus::~RuntimeControlBus()
  {
    Stop();
  }

  ControlResponse RuntimeControlBus::PauseProcessing(const std::string_view handlerName)
  {
    return ExecuteControl("PauseProcessing", handlerName,
                          [](IRuntimeControlService& service, std::stop_token stopToken) { return service.PauseProcessing(stopToken); });
  }

  ControlResponse RuntimeControlBus::ResumeProcessing(const std::string_view handlerName)
  {
    return ExecuteControl("ResumeProcessing", handlerName,
                          [](IRuntimeControlService& service, std::stop_token stopToken) { return service.ResumeProcessing(stopToken); });
  }

  ControlResponse RuntimeControlBus::SingleStep(const std::string_view handlerName)
  {
    return ExecuteControl("SingleStep", handlerName,
                          [](IRuntimeControlService& service, std::stop_token stopToken) { return service.SingleStep(stopToken); });
  }

  std::optional<ProcessorQueueStatus> RuntimeControlBus::GetProcessorQueueStatus(const std::string_view handlerName)
  {
    return ExecuteQuery<ProcessorQueueStatus>("GetProcessorQueueStatus", handlerName,
                                              [](IRuntimeControlService& service, std::stop_token stopToken)
                                              { return service.GetProcessorQueueStatus(stopToken); });
  }

  std::optional<RuntimeStatus> RuntimeControlBus::GetRuntimeStatus(const std::string_view handlerName)
  {
    return ExecuteQuery<RuntimeStatus>("GetRuntimeStatus", handlerName,
                                       [](IRuntimeControlService& service, std::stop_token stopToken) { return service.GetRuntimeStatus(stopToken); });
  }

  ControlResponse RuntimeControlBus::RequestShutdown(const std::string& reason, const std::string_view handlerName)
  {
    GetLogger()->warn("RequestShutdown: '{}' requested shutdown: {}", handlerName, reason);
    auto response = ExecuteControl("RequestShutdown", handlerName,
                                   [reason](IRuntimeControlService& service, std::stop_token stopToken) { return service.Shutdown(reason, stopToken); });
    if (response.Success)
    {
      m_shutdownRequested = true;
    }

    AuditEvent event;
    event.Type = AuditEventType::ShutdownRequested;
    event.Subject = std::string(handlerName);
    event.Detail = fmt::format("reason='{}' accepted={}", reason, response.Success);
    m_registry.GetAuditLog()->Record(std::move(event));
    return response;
  }

  void RuntimeControlBus::ProcessMessage(BusMessage& message)
  {
    GetLogger()->warn("RuntimeControlBus: control operations are synchronous, ignoring queued message {} ({})", message.CorrelationId,
                      typeid(message).name());
  }

  void RuntimeControlBus::CollectMetrics(std::map<std::string, double>& rMetrics) const
  {
    rMetrics["commands_sent"] = static_cast<double>(m_commandsSent.load());
    rMetrics["commands_failed"] = static_cast<double>(m_commandsFailed.load());
    rMetrics["state_queries"] = static_cast<double>(m_stateQueries.load());
    rMetrics["shutdown_requested"] = m_shutdownRequested.load() ? 1.0 : 0.0;
  }

  ControlResponse RuntimeControlBus::ExecuteControl(const std::string_view command, const std::string_view handlerName, const ControlCall& call)
  {
    EnsureRunning(command);
    if (m_shutdownRequested.load())
    {
      GetLogger()->warn("{}: refused for '{}', shutdown in progress", command, handlerName);
      ++m_commandsFailed;
      return MakeFailure(fmt::format("{} refused", command), "Shutdown in progress", "shutting_down");
    }

    ++m_commandsSent;
    auto candidates = FindProviders(ProviderQuery{});
    if (candidates.empty())
    {
      GetLogger()->warn("{}: no runtime control service available (handler '{}')", command, handlerName);
      ++m_commandsFailed;
      return MakeFailure(fmt::format("{} not delivered", command), "No runtime control service available");
    }

    try
    {
      auto response = TryExecute<ControlResponse>(std::move(candidates), command,
                                                  [this, &call](const ProviderRecord& record)
                                                  {
                                                    auto service = record.GetInstance<IRuntimeControlService>();
                                                    return InvokeProvider<ControlResponse>(record, [service, call](std::stop_token stopToken)
                                                                                           { return call(*service, stopToken); });
                                                  });
      if (response.has_value())
      {
        if (!response->Success)
        {
          ++m_commandsFailed;
        }
        return std::move(*response);
      }
      ++m_commandsFailed;
      return MakeFailure(fmt::format("{} not delivered", command), "No runtime control service accepted the call");
    }
    catch (const OperationFailedException& ex)
    {
      ++m_commandsFailed;
      return MakeFailure(fmt::format("{} failed", command), ex.what());
    }
  }

  template <typename TResult>
  std::optional<TResult> RuntimeControlBus::ExecuteQuery(const std::string_view query, const std::string_view handlerName,
                                                         const std::function<TResult(IRuntimeControlService&, std::stop_token)>& call)
  {
    EnsureRunning(query);
    ++m_stateQueries;
    try
    {
      return TryExecute<TResult>(FindProviders(ProviderQuery{}), query,
                                 [this, &call](const ProviderRecord& record)
                                 {
                                   auto service = record.GetInstance<IRuntimeControlService>();
                                   return InvokeProvider<TResult>(record, [service, call](std::stop_token stopToken) { return call(*service, stopToken); });
                                 });
    }
    catch (const OperationFailedException& ex)
    {
      GetLogger()->error("{}: failed for '{}': {}", query, handlerName, ex.what());
      return std::nullopt;
    }
  }
}
