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

#include <AgentMesh/Bus/BusManager.hpp>
#include <AgentMesh/Exception/CapabilityProhibitedException.hpp>
#include <AgentMesh/Exception/OperationFailedException.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <AgentMesh/Service/ICommunicationService.hpp>
#include <AgentMesh/Service/ILlmService.hpp>
#include <AgentMesh/Service/IToolService.hpp>
#include <AgentMesh/Service/IWiseAuthorityService.hpp>
#include <boost/version.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
  using namespace AgentMesh;

  class ConsoleChannel final : public ICommunicationService
  {
  public:
    std::string GetName() const override
    {
      return "console";
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return {"send_message", "fetch_messages"};
    }

    bool SendMessage(const std::string& channelId, const std::string& content, std::stop_token /*stopToken*/) override
    {
      spdlog::info("[{}] {}", channelId, content);
      return true;
    }

    std::vector<FetchedMessage> FetchMessages(const std::string& /*channelId*/, uint32_t /*limit*/, std::stop_token /*stopToken*/) override
    {
      return {};
    }

    std::optional<std::string> GetHomeChannelId() const override
    {
      return "console:home";
    }
  };

  class FlakyCalculator final : public IToolService
  {
    std::atomic<uint32_t> m_calls{0};

  public:
    std::string GetName() const override
    {
      return "flaky_calculator";
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return {"execute_tool"};
    }

    std::vector<std::string> GetAvailableTools() const override
    {
      return {"add"};
    }

    std::optional<ToolInfo> GetToolInfo(const std::string& toolName) const override
    {
      return ToolInfo{toolName, "Adds two integers", {{"a", "integer"}, {"b", "integer"}}, "math"};
    }

    ToolExecutionResult ExecuteTool(const std::string& toolName, const ToolParameters& /*parameters*/, std::stop_token /*stopToken*/) override
    {
      ++m_calls;
      throw std::runtime_error(fmt::format("'{}' backend unreachable", toolName));
    }
  };

  class Calculator final : public IToolService
  {
  public:
    std::string GetName() const override
    {
      return "calculator";
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return {"execute_tool"};
    }

    std::vector<std::string> GetAvailableTools() const override
    {
      return {"add"};
    }

    std::optional<ToolInfo> GetToolInfo(const std::string& toolName) const override
    {
      return ToolInfo{toolName, "Adds two integers", {{"a", "integer"}, {"b", "integer"}}, "math"};
    }

    ToolExecutionResult ExecuteTool(const std::string& toolName, const ToolParameters& parameters, std::stop_token /*stopToken*/) override
    {
      const int sum = std::stoi(parameters.at("a")) + std::stoi(parameters.at("b"));
      ToolExecutionResult result;
      result.ToolName = toolName;
      result.Status = ToolExecutionStatus::Completed;
      result.Success = true;
      result.Output = std::to_string(sum);
      return result;
    }
  };

  class EchoModel final : public ILlmService
  {
    std::string m_name;

  public:
    explicit EchoModel(std::string name)
      : m_name(std::move(name))
    {
    }

    std::string GetName() const override
    {
      return m_name;
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return {"call_llm"};
    }

    LlmResult CallLlm(const LlmRequest& request, std::stop_token /*stopToken*/) override
    {
      LlmResult result;
      result.Model = m_name + "-echo";
      result.Content = request.Messages.empty() ? std::string() : request.Messages.back().Content;
      result.Usage.InputTokens = static_cast<uint32_t>(result.Content.size());
      result.Usage.OutputTokens = static_cast<uint32_t>(result.Content.size());
      return result;
    }

    std::vector<std::string> GetAvailableModels() const override
    {
      return {m_name + "-echo"};
    }
  };

  class Council final : public IWiseAuthorityService
  {
    std::string m_name;
    double m_confidence;

  public:
    Council(std::string name, const double confidence)
      : m_name(std::move(name))
      , m_confidence(confidence)
    {
    }

    std::string GetName() const override
    {
      return m_name;
    }

    std::vector<std::string> GetCapabilities() const override
    {
      return {"send_deferral", "fetch_guidance", "ethics"};
    }

    bool SendDeferral(const DeferralRequest& request, std::stop_token /*stopToken*/) override
    {
      spdlog::info("{} received deferral of thought '{}': {}", m_name, request.ThoughtId, request.Reason);
      return true;
    }

    std::optional<std::string> FetchGuidance(const GuidanceContext& context, std::stop_token /*stopToken*/) override
    {
      return fmt::format("{} suggests reconsidering '{}'", m_name, context.Question);
    }

    std::optional<GuidanceResponse> GetGuidance(const GuidanceRequest& request, std::stop_token /*stopToken*/) override
    {
      GuidanceResponse response;
      response.SelectedOption = request.Options.empty() ? std::nullopt : std::optional<std::string>(request.Options.front());
      response.Reasoning = fmt::format("{} weighed {} option(s)", m_name, request.Options.size());
      response.WaId = m_name;
      response.Signature = "demo";
      response.Advice.push_back(WisdomAdvice{"ethics", m_name, "Prefer the least harmful option", std::nullopt, m_confidence});
      return response;
    }
  };
}

int main()
{
  spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::info("AgentMesh demo (Boost {}.{}.{})", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100);

  try
  {
    ServiceRegistry registry;

    CircuitBreakerConfig breakerConfig;
    breakerConfig.FailureThreshold = 2;

    registry.Register({ServiceType::Communication, std::make_shared<ConsoleChannel>()});
    registry.Register({ServiceType::Tool, std::make_shared<FlakyCalculator>(), "", ServicePriority::Normal, ServicePriorityGroup(), {},
                       SelectionStrategy::Fallback, {}, breakerConfig});
    registry.Register({ServiceType::Tool, std::make_shared<Calculator>(), "", ServicePriority::Low});
    registry.Register({ServiceType::Llm, std::make_shared<EchoModel>("general_model")});
    registry.Register({ServiceType::Llm, std::make_shared<EchoModel>("legal_model"), "", ServicePriority::Normal, ServicePriorityGroup(), {},
                       SelectionStrategy::Fallback, {{"domain", "legal"}}});
    registry.Register({ServiceType::WiseAuthority, std::make_shared<Council>("north_council", 0.6)});
    registry.Register({ServiceType::WiseAuthority, std::make_shared<Council>("south_council", 0.9)});

    BusManager buses(registry);
    buses.Start();

    buses.GetCommunicationBus().SendMessage("console:home", "Hello from the mesh", "demo");

    for (int i = 0; i < 3; ++i)
    {
      const auto result = buses.GetToolBus().ExecuteTool("add", {{"a", "2"}, {"b", std::to_string(i)}}, "demo");
      spdlog::info("add -> status {} output '{}' from '{}'", ToString(result.Status), result.Output, result.ProviderName);
    }

    LlmRequest llmRequest;
    llmRequest.Messages.push_back({"user", "Summarize the contract"});
    llmRequest.Domain = "legal";
    const auto llmResult = buses.GetLlmBus().CallLlm(llmRequest, "demo");
    spdlog::info("CallLlm answered by '{}'", llmResult.ProviderName);

    GuidanceRequest guidanceRequest;
    guidanceRequest.Context = "Should the agent share the draft?";
    guidanceRequest.Options = {"share", "hold"};
    guidanceRequest.Capability = "ethics";
    const auto guidance = buses.GetWiseBus().RequestGuidance(guidanceRequest);
    spdlog::info("Guidance from '{}': {}", guidance.WaId, guidance.Reasoning);

    try
    {
      guidanceRequest.Capability = "domain:medical";
      buses.GetWiseBus().RequestGuidance(guidanceRequest);
    }
    catch (const CapabilityProhibitedException& ex)
    {
      spdlog::info("Rejected as expected: {}", ex.what());
    }

    DeferralContext deferral;
    deferral.ThoughtId = "thought-1";
    deferral.TaskId = "task-1";
    deferral.Reason = "Needs human review";
    buses.GetWiseBus().SubmitDeferral(deferral, "demo");

    buses.Stop();
    for (const auto& stats : buses.GetAllStats())
    {
      spdlog::info("{} bus: processed {} failed {} dropped {}", ToString(stats.Type), stats.Processed, stats.Failed, stats.Dropped);
    }
    for (const auto& [type, providers] : registry.Snapshot().Providers)
    {
      for (const auto& provider : providers)
      {
        spdlog::info("{}/{}: breaker {} requests {} failures {}", ToString(type), provider.Name, ToString(provider.Breaker.State),
                     provider.Metrics.TotalRequests, provider.Metrics.FailedRequests);
      }
    }
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Exception: {}", ex.what());
    return 1;
  }
  return 0;
}
