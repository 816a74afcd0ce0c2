#ifndef AGENTMESH_UNITTEST_TESTPROVIDERS_HPP
#define AGENTMESH_UNITTEST_TESTPROVIDERS_HPP
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

#include <AgentMesh/Exception/ProviderRateLimitedException.hpp>
#include <AgentMesh/Log/AuditLog.hpp>
#include <AgentMesh/Registry/ProviderHandle.hpp>
#include <AgentMesh/Registry/ServiceRegistration.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <AgentMesh/Service/ICommunicationService.hpp>
#include <AgentMesh/Service/ILlmService.hpp>
#include <AgentMesh/Service/IRuntimeControlService.hpp>
#include <AgentMesh/Service/IToolService.hpp>
#include <AgentMesh/Service/IWiseAuthorityService.hpp>
#include <AgentMesh/Util/SteadyClock.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace AgentMesh::Test
{
  /// @brief Clock that only moves when the test advances it. Copies share the same time.
  class ManualClock
  {
    struct State
    {
      std::mutex Mutex;
      SteadyClock::time_point Now{std::chrono::hours(1)};
    };

    std::shared_ptr<State> m_state{std::make_shared<State>()};

  public:
    void Advance(const std::chrono::milliseconds duration)
    {
      std::lock_guard<std::mutex> lock(m_state->Mutex);
      m_state->Now += duration;
    }

    SteadyClock::time_point Now() const
    {
      std::lock_guard<std::mutex> lock(m_state->Mutex);
      return m_state->Now;
    }

    ClockFunction GetFunction() const
    {
      auto state = m_state;
      return [state]()
      {
        std::lock_guard<std::mutex> lock(state->Mutex);
        return state->Now;
      };
    }
  };

  /// @brief Blocks until stop is requested or the safety limit elapses.
  /// @return true if stop was requested.
  inline bool BlockUntilStopped(std::stop_token stopToken, const std::chrono::milliseconds limit = std::chrono::seconds(10))
  {
    std::mutex mutex;
    std::condition_variable_any condition;
    std::unique_lock<std::mutex> lock(mutex);
    const bool satisfied = condition.wait_for(lock, stopToken, limit, []() { return false; });
    return satisfied || stopToken.stop_requested();
  }

  /// @brief Polls a condition until it holds or the limit elapses.
  template <typename TPredicate>
  bool WaitUntil(TPredicate predicate, const std::chrono::milliseconds limit = std::chrono::seconds(5))
  {
    const auto deadline = SteadyClock::now() + limit;
    while (!predicate())
    {
      if (SteadyClock::now() >= deadline)
      {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
  }

  class RecordingAuditSink final : public IAuditSink
  {
    mutable std::mutex m_mutex;
    std::vector<AuditEvent> m_events;

  public:
    void Record(const AuditEvent& event) override
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_events.push_back(event);
    }

    std::vector<AuditEvent> GetEvents() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_events;
    }
  };

  /// @brief Name, capabilities and health shared by the fake providers.
  class FakeServiceBase : public virtual IService
  {
    std::string m_name;
    std::vector<std::string> m_capabilities;
    std::atomic<bool> m_healthy{true};
    mutable std::atomic<uint32_t> m_healthChecks{0};
    mutable std::mutex m_healthMutex;
    mutable std::condition_variable m_healthCondition;
    bool m_stallHealthCheck{false};

  public:
    FakeServiceBase(std::string name, std::vector<std::string> capabilities)
      : m_name(std::move(name))
      , m_capabilities(std::move(capabilities))
    {
    }

    std::string GetName() const override
    {
      return m_name;
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return m_capabilities;
    }

    bool IsHealthy() const override
    {
      ++m_healthChecks;
      std::unique_lock<std::mutex> lock(m_healthMutex);
      m_healthCondition.wait_for(lock, std::chrono::seconds(10), [this]() { return !m_stallHealthCheck; });
      return m_healthy.load();
    }

    void SetHealthy(const bool healthy)
    {
      m_healthy = healthy;
    }

    /// @brief Health checks block until ReleaseHealthCheck is called. Release before the invoker is destroyed.
    void StallHealthCheck()
    {
      std::lock_guard<std::mutex> lock(m_healthMutex);
      m_stallHealthCheck = true;
    }

    void ReleaseHealthCheck()
    {
      {
        std::lock_guard<std::mutex> lock(m_healthMutex);
        m_stallHealthCheck = false;
      }
      m_healthCondition.notify_all();
    }

    uint32_t GetHealthChecks() const
    {
      return m_healthChecks.load();
    }
  };

  /// @brief Implements IService only, so it fits no service type.
  class PlainService final : public FakeServiceBase
  {
  public:
    explicit PlainService(std::string name)
      : FakeServiceBase(std::move(name), {})
    {
    }
  };

  enum class FakeBehavior
  {
    Succeed,
    Fail,
    Throw,
    Hang,
    RateLimit,
  };

  class FakeCommunicationService final
    : public FakeServiceBase
    , public ICommunicationService
  {
    std::atomic<bool> m_failSend{false};
    std::atomic<uint32_t> m_sendCalls{0};
    std::optional<std::string> m_homeChannel;
    std::vector<FetchedMessage> m_history;
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, std::string>> m_sent;

  public:
    explicit FakeCommunicationService(std::string name, std::optional<std::string> homeChannel = std::nullopt)
      : FakeServiceBase(std::move(name), {"send_message", "fetch_messages"})
      , m_homeChannel(std::move(homeChannel))
    {
    }

    void SetFailSend(const bool fail)
    {
      m_failSend = fail;
    }

    void AddHistory(const std::string& channelId, const std::string& content)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      FetchedMessage message;
      message.MessageId = fmt::format("m{}", m_history.size() + 1);
      message.ChannelId = channelId;
      message.AuthorId = "user";
      message.AuthorName = "User";
      message.Content = content;
      m_history.push_back(std::move(message));
    }

    bool SendMessage(const std::string& channelId, const std::string& content, std::stop_token /*stopToken*/) override
    {
      ++m_sendCalls;
      if (m_failSend.load())
      {
        return false;
      }
      std::lock_guard<std::mutex> lock(m_mutex);
      m_sent.emplace_back(channelId, content);
      return true;
    }

    std::vector<FetchedMessage> FetchMessages(const std::string& channelId, const uint32_t limit, std::stop_token /*stopToken*/) override
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      std::vector<FetchedMessage> result;
      for (const auto& message : m_history)
      {
        if (message.ChannelId == channelId && result.size() < limit)
        {
          result.push_back(message);
        }
      }
      return result;
    }

    std::optional<std::string> GetHomeChannelId() const override
    {
      return m_homeChannel;
    }

    uint32_t GetSendCalls() const
    {
      return m_sendCalls.load();
    }

    std::vector<std::pair<std::string, std::string>> GetSent() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_sent;
    }
  };

  class FakeToolService final
    : public FakeServiceBase
    , public IToolService
  {
    std::vector<std::string> m_tools;
    std::atomic<FakeBehavior> m_behavior{FakeBehavior::Succeed};
    std::atomic<uint32_t> m_calls{0};

  public:
    FakeToolService(std::string name, std::vector<std::string> tools)
      : FakeServiceBase(std::move(name), {"execute_tool"})
      , m_tools(std::move(tools))
    {
    }

    void SetBehavior(const FakeBehavior behavior)
    {
      m_behavior = behavior;
    }

    std::vector<std::string> GetAvailableTools() const override
    {
      return m_tools;
    }

    std::optional<ToolInfo> GetToolInfo(const std::string& toolName) const override
    {
      if (std::find(m_tools.begin(), m_tools.end(), toolName) == m_tools.end())
      {
        return std::nullopt;
      }
      ToolInfo info;
      info.Name = toolName;
      info.Description = fmt::format("{} provided by {}", toolName, GetName());
      return info;
    }

    ToolExecutionResult ExecuteTool(const std::string& toolName, const ToolParameters& parameters, std::stop_token stopToken) override
    {
      ++m_calls;
      ToolExecutionResult result;
      result.ToolName = toolName;
      switch (m_behavior.load())
      {
      case FakeBehavior::Succeed:
        result.Status = ToolExecutionStatus::Completed;
        result.Success = true;
        result.Output = fmt::format("{} ran {} with {} parameter(s)", GetName(), toolName, parameters.size());
        return result;
      case FakeBehavior::Fail:
        result.Status = ToolExecutionStatus::Failed;
        result.Error = fmt::format("{} is broken", GetName());
        return result;
      case FakeBehavior::Hang:
        BlockUntilStopped(stopToken);
        throw std::runtime_error(fmt::format("{} was cancelled", GetName()));
      case FakeBehavior::Throw:
      case FakeBehavior::RateLimit:
        break;
      }
      throw std::runtime_error(fmt::format("{} threw", GetName()));
    }

    uint32_t GetCalls() const
    {
      return m_calls.load();
    }
  };

  class FakeLlmService final
    : public FakeServiceBase
    , public ILlmService
  {
    std::vector<std::string> m_models;
    std::atomic<FakeBehavior> m_behavior{FakeBehavior::Succeed};
    std::optional<std::chrono::milliseconds> m_retryAfter;
    std::chrono::milliseconds m_delay{0};
    std::atomic<uint32_t> m_calls{0};

  public:
    explicit FakeLlmService(std::string name, std::vector<std::string> models = {"test-model"}, const std::chrono::milliseconds delay = {})
      : FakeServiceBase(std::move(name), {"call_llm"})
      , m_models(std::move(models))
      , m_delay(delay)
    {
    }

    void SetBehavior(const FakeBehavior behavior)
    {
      m_behavior = behavior;
    }

    /// @brief Set before the fake is registered.
    void SetRetryAfter(const std::optional<std::chrono::milliseconds> retryAfter)
    {
      m_retryAfter = retryAfter;
    }

    LlmResult CallLlm(const LlmRequest& request, std::stop_token stopToken) override
    {
      ++m_calls;
      switch (m_behavior.load())
      {
      case FakeBehavior::Succeed:
      {
        if (m_delay.count() > 0)
        {
          std::this_thread::sleep_for(m_delay);
        }
        LlmResult result;
        result.Content = fmt::format("{} answered {} message(s)", GetName(), request.Messages.size());
        result.Model = request.Model.value_or(m_models.empty() ? std::string("default") : m_models.front());
        result.Usage.InputTokens = 10;
        result.Usage.OutputTokens = 20;
        result.Usage.CostCents = 0.5;
        return result;
      }
      case FakeBehavior::RateLimit:
        throw ProviderRateLimitedException(fmt::format("{} is rate limited", GetName()), m_retryAfter);
      case FakeBehavior::Hang:
        BlockUntilStopped(stopToken);
        throw std::runtime_error(fmt::format("{} was cancelled", GetName()));
      case FakeBehavior::Fail:
      case FakeBehavior::Throw:
        break;
      }
      throw std::runtime_error(fmt::format("{} is down", GetName()));
    }

    std::vector<std::string> GetAvailableModels() const override
    {
      return m_models;
    }

    uint32_t GetCalls() const
    {
      return m_calls.load();
    }
  };

  class FakeWiseAuthority final
    : public FakeServiceBase
    , public IWiseAuthorityService
  {
    std::optional<double> m_confidence;
    std::atomic<FakeBehavior> m_behavior{FakeBehavior::Succeed};
    std::atomic<bool> m_acknowledge{true};
    std::atomic<uint32_t> m_guidanceCalls{0};
    mutable std::mutex m_mutex;
    std::vector<DeferralRequest> m_deferrals;

  public:
    FakeWiseAuthority(std::string name, const std::optional<double> confidence, std::vector<std::string> extraCapabilities = {})
      : FakeServiceBase(name,
                        [&extraCapabilities]()
                        {
                          std::vector<std::string> capabilities{"send_deferral", "fetch_guidance"};
                          capabilities.insert(capabilities.end(), extraCapabilities.begin(), extraCapabilities.end());
                          return capabilities;
                        }())
      , m_confidence(confidence)
    {
    }

    /// @brief Succeed answers, Fail answers with no opinion, Hang waits for the stop request.
    void SetBehavior(const FakeBehavior behavior)
    {
      m_behavior = behavior;
    }

    void SetAcknowledge(const bool acknowledge)
    {
      m_acknowledge = acknowledge;
    }

    bool SendDeferral(const DeferralRequest& request, std::stop_token stopToken) override
    {
      if (m_behavior.load() == FakeBehavior::Hang)
      {
        BlockUntilStopped(stopToken);
        return false;
      }
      std::lock_guard<std::mutex> lock(m_mutex);
      m_deferrals.push_back(request);
      return m_acknowledge.load();
    }

    std::optional<std::string> FetchGuidance(const GuidanceContext& context, std::stop_token /*stopToken*/) override
    {
      if (m_behavior.load() != FakeBehavior::Succeed)
      {
        throw std::runtime_error(fmt::format("{} can not answer", GetName()));
      }
      return fmt::format("{} says: proceed with {}", GetName(), context.Question);
    }

    std::optional<GuidanceResponse> GetGuidance(const GuidanceRequest& request, std::stop_token stopToken) override
    {
      ++m_guidanceCalls;
      switch (m_behavior.load())
      {
      case FakeBehavior::Hang:
        BlockUntilStopped(stopToken);
        return std::nullopt;
      case FakeBehavior::Fail:
        return std::nullopt;
      case FakeBehavior::Throw:
        throw std::runtime_error(fmt::format("{} threw", GetName()));
      case FakeBehavior::Succeed:
      case FakeBehavior::RateLimit:
        break;
      }

      GuidanceResponse response;
      response.SelectedOption = request.Options.empty() ? std::nullopt : std::optional<std::string>(request.Options.front());
      response.Reasoning = fmt::format("{} reasoning", GetName());
      response.WaId = GetName();
      response.Signature = fmt::format("sig-{}", GetName());
      response.Confidence = m_confidence;
      WisdomAdvice advice;
      advice.Capability = request.Capability.value_or("general");
      advice.ProviderName = GetName();
      advice.Explanation = "advice";
      response.Advice.push_back(std::move(advice));
      return response;
    }

    uint32_t GetGuidanceCalls() const
    {
      return m_guidanceCalls.load();
    }

    std::vector<DeferralRequest> GetDeferrals() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_deferrals;
    }
  };

  class FakeRuntimeControl final
    : public FakeServiceBase
    , public IRuntimeControlService
  {
    std::atomic<FakeBehavior> m_behavior{FakeBehavior::Succeed};
    std::atomic<bool> m_paused{false};
    std::atomic<bool> m_acceptShutdown{true};
    std::atomic<uint32_t> m_commands{0};

  public:
    explicit FakeRuntimeControl(std::string name)
      : FakeServiceBase(std::move(name), {"pause_processing", "resume_processing", "single_step", "shutdown"})
    {
    }

    void SetBehavior(const FakeBehavior behavior)
    {
      m_behavior = behavior;
    }

    void SetAcceptShutdown(const bool accept)
    {
      m_acceptShutdown = accept;
    }

    ControlResponse PauseProcessing(std::stop_token /*stopToken*/) override
    {
      return Command("paused", [this]() { m_paused = true; });
    }

    ControlResponse ResumeProcessing(std::stop_token /*stopToken*/) override
    {
      return Command("running", [this]() { m_paused = false; });
    }

    ControlResponse SingleStep(std::stop_token /*stopToken*/) override
    {
      return Command("paused", []() {});
    }

    ProcessorQueueStatus GetProcessorQueueStatus(std::stop_token /*stopToken*/) override
    {
      ThrowIfBroken();
      ProcessorQueueStatus status;
      status.ProcessorName = GetName();
      status.QueueSize = 3;
      status.MaxSize = 100;
      return status;
    }

    RuntimeStatus GetRuntimeStatus(std::stop_token /*stopToken*/) override
    {
      ThrowIfBroken();
      RuntimeStatus status;
      status.IsRunning = true;
      status.IsPaused = m_paused.load();
      status.ProcessorState = m_paused.load() ? "paused" : "running";
      status.Uptime = std::chrono::seconds(42);
      return status;
    }

    ControlResponse Shutdown(const std::string& reason, std::stop_token /*stopToken*/) override
    {
      ThrowIfBroken();
      ++m_commands;
      ControlResponse response;
      response.Success = m_acceptShutdown.load();
      response.Message = fmt::format("shutdown: {}", reason);
      response.ProcessorState = response.Success ? "shutting_down" : "running";
      if (!response.Success)
      {
        response.Error = "shutdown refused";
      }
      return response;
    }

    bool IsPaused() const
    {
      return m_paused.load();
    }

    uint32_t GetCommands() const
    {
      return m_commands.load();
    }

  private:
    void ThrowIfBroken() const
    {
      if (m_behavior.load() != FakeBehavior::Succeed)
      {
        throw std::runtime_error(fmt::format("{} is not responding", GetName()));
      }
    }

    template <typename TAction>
    ControlResponse Command(const char* state, TAction action)
    {
      ThrowIfBroken();
      ++m_commands;
      action();
      ControlResponse response;
      response.Success = true;
      response.Message = "ok";
      response.ProcessorState = state;
      return response;
    }
  };

  /// @brief Registers a provider with the most common settings.
  inline ProviderHandle RegisterProvider(ServiceRegistry& registry, const ServiceType type, std::shared_ptr<IService> provider,
                                         const ServicePriority priority = ServicePriority::Normal, const uint32_t failureThreshold = 5)
  {
    ServiceRegistration registration;
    registration.Type = type;
    registration.Provider = std::move(provider);
    registration.Priority = priority;
    registration.BreakerConfig.FailureThreshold = failureThreshold;
    return registry.Register(std::move(registration));
  }

  /// @brief The snapshot entry of a provider, throws if it is not registered.
  inline ProviderSnapshot FindSnapshot(const ServiceRegistry& registry, const ServiceType type, const std::string& name)
  {
    const auto snapshot = registry.Snapshot(type);
    const auto itr = snapshot.Providers.find(type);
    if (itr != snapshot.Providers.end())
    {
      for (const auto& provider : itr->second)
      {
        if (provider.Name == name)
        {
          return provider;
        }
      }
    }
    throw std::out_of_range(fmt::format("provider '{}' is not registered", name));
  }
}

#endif
