#ifndef AGENTMESH_BUS_WISEBUS_HPP
#define AGENTMESH_BUS_WISEBUS_HPP
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
#include <AgentMesh/Bus/CapabilityFirewall.hpp>
#include <AgentMesh/Service/WiseAuthorityTypes.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace AgentMesh
{
  namespace WiseAuthorityCapabilities
  {
    inline constexpr std::string_view SendDeferral = "send_deferral";
    inline constexpr std::string_view FetchGuidance = "fetch_guidance";
  }

  /// @brief A deferral queued with WiseBus::SubmitDeferral.
  struct DeferralMessage : BusMessage
  {
    DeferralContext Context;
  };

  /// @brief Routes deferrals and guidance requests to wise authorities.
  ///
  /// Guidance capabilities pass through a CapabilityFirewall before any provider is looked up.
  class WiseBus final : public BusBase
  {
    WiseBusConfig m_wiseConfig;
    CapabilityFirewall m_firewall;
    std::atomic<uint64_t> m_deferralsSent{0};
    std::atomic<uint64_t> m_deferralsUndelivered{0};
    std::atomic<uint64_t> m_guidanceRequests{0};
    std::atomic<uint64_t> m_degradedResponses{0};

  public:
    WiseBus(ServiceRegistry& registry, ProviderInvoker& invoker, const WiseBusConfig& config = {});
    ~WiseBus() override;

    /// @brief Broadcasts a deferral to every available authority that accepts deferrals.
    ///
    /// The authorities are called concurrently and the broadcast is bounded by DeferralTimeout.
    /// An unset DeferUntil defaults to one hour from now.
    /// @return true if at least one authority acknowledged.
    bool SendDeferral(const DeferralContext& context, std::string_view handlerName);

    /// @brief Queues a deferral broadcast for the consumer thread.
    /// @return false if the bus dropped it.
    bool SubmitDeferral(DeferralContext context, std::string handlerName);

    /// @brief Asks the authorities to review something, expressed as a deferral.
    bool RequestReview(const std::string& reviewType, const std::map<std::string, std::string>& reviewData, std::string_view handlerName);

    /// @brief Asks up to MaxGuidanceFanOut authorities concurrently and arbitrates by confidence.
    ///
    /// When a capability is set only authorities declaring it are asked.
    /// @param timeout Overall bound, GuidanceTimeout if unset.
    /// @return The selected response, or a degraded response if no authority answered.
    /// @throws CapabilityProhibitedException if the capability is in a prohibited domain.
    GuidanceResponse RequestGuidance(const GuidanceRequest& request, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Single answer guidance from the best available authority.
    /// @return nullopt if no authority answered.
    std::optional<std::string> FetchGuidance(const GuidanceContext& context, std::string_view handlerName);

    [[nodiscard]] const CapabilityFirewall& GetFirewall() const noexcept
    {
      return m_firewall;
    }

  protected:
    void ProcessMessage(BusMessage& message) override;
    void CollectMetrics(std::map<std::string, double>& rMetrics) const override;

  private:
    bool BroadcastDeferral(const DeferralContext& context, std::string_view handlerName);
  };
}

#endif
