#ifndef AGENTMESH_BUS_RUNTIMECONTROLBUS_HPP
#define AGENTMESH_BUS_RUNTIMECONTROLBUS_HPP
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
#include <AgentMesh/Service/RuntimeControlTypes.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace AgentMesh
{
  class IRuntimeControlService;

  /// @brief Routes processor control commands to the runtime control provider.
  ///
  /// Once a shutdown has been accepted, pause, resume and single step are refused.
  class RuntimeControlBus final : public BusBase
  {
    std::atomic<bool> m_shutdownRequested{false};
    std::atomic<uint64_t> m_commandsSent{0};
    std::atomic<uint64_t> m_commandsFailed{0};
    std::atomic<uint64_t> m_stateQueries{0};

  public:
    RuntimeControlBus(ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config = {});
    ~RuntimeControlBus() override;

    ControlResponse PauseProcessing(std::string_view handlerName);
    ControlResponse ResumeProcessing(std::string_view handlerName);
    ControlResponse SingleStep(std::string_view handlerName);

    /// @return nullopt if no provider answered.
    std::optional<ProcessorQueueStatus> GetProcessorQueueStatus(std::string_view handlerName);

    /// @return nullopt if no provider answered.
    std::optional<RuntimeStatus> GetRuntimeStatus(std::string_view handlerName);

    /// @brief Asks the runtime to shut down. A successful response blocks further control commands.
    ControlResponse RequestShutdown(const std::string& reason, std::string_view handlerName);

    [[nodiscard]] bool IsShutdownRequested() const noexcept
    {
      return m_shutdownRequested.load();
    }

  protected:
    void ProcessMessage(BusMessage& message) override;
    void CollectMetrics(std::map<std::string, double>& rMetrics) const override;

  private:
    using ControlCall = std::function<ControlResponse(IRuntimeControlService&, std::stop_token)>;

    ControlResponse ExecuteControl(std::string_view command, std::string_view handlerName, const ControlCall& call);

    template <typename TResult>
    std::optional<TResult> ExecuteQuery(std::string_view query, std::string_view handlerName,
                                        const std::function<TResult(IRuntimeControlService&, std::stop_token)>& call);
  };
}

#endif
