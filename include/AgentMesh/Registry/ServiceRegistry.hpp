#ifndef AGENTMESH_REGISTRY_SERVICEREGISTRY_HPP
#define AGENTMESH_REGISTRY_SERVICEREGISTRY_HPP
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

#include <AgentMesh/Log/AuditLog.hpp>
#include <AgentMesh/Registry/ProviderHandle.hpp>
#include <AgentMesh/Registry/ProviderQuery.hpp>
#include <AgentMesh/Registry/ProviderRecord.hpp>
#include <AgentMesh/Registry/RegistrySnapshot.hpp>
#include <AgentMesh/Registry/ServiceRegistration.hpp>
#include <AgentMesh/Registry/ServiceType.hpp>
#include <AgentMesh/Util/SteadyClock.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief Thread safe registry of service providers and their circuit breakers.
  ///
  /// Every registered provider owns exactly one circuit breaker. The breaker is created on
  /// registration, destroyed on unregistration and never handed out; buses report call outcomes
  /// through RecordSuccess and RecordFailure.
  ///
  /// The registry is passed explicitly to the buses that use it, several registries can coexist.
  class ServiceRegistry
  {
    struct ProviderEntry;
    using EntryList = std::vector<std::shared_ptr<ProviderEntry>>;

    std::shared_ptr<AuditLog> m_auditLog;
    ClockFunction m_clock;

    /// @brief Protects the provider lists. Breakers and metrics have their own locks.
    mutable std::shared_mutex m_mutex;
    std::map<ServiceType, EntryList> m_providers;
    uint64_t m_nextId{1};
    uint64_t m_nextRegistrationOrder{0};

    std::mutex m_readyMutex;
    std::condition_variable m_readyCondition;

  public:
    /// @param auditLog Receives circuit breaker resets. A private audit log is created if null.
    /// @param clock Time source for the circuit breakers and metrics.
    explicit ServiceRegistry(std::shared_ptr<AuditLog> auditLog = nullptr, ClockFunction clock = DefaultClock());
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;
    ServiceRegistry(ServiceRegistry&&) = delete;
    ServiceRegistry& operator=(ServiceRegistry&&) = delete;

    /// @brief Registers a provider and creates its circuit breaker.
    ///
    /// @throws InvalidProviderException if the provider is null, the name is empty, the breaker
    ///         config is invalid or the provider does not implement the typed interface of the service type.
    /// @throws DuplicateProviderRegistrationException if the name is already registered for the type.
    ProviderHandle Register(ServiceRegistration registration);

    /// @brief Removes a provider and its breaker.
    /// @return false if the handle is unknown (already unregistered).
    bool Unregister(const ProviderHandle& handle);

    /// @brief Removes a provider by name.
    /// @return false if no provider of that name is registered for the type.
    bool Unregister(ServiceType type, const std::string& name);

    /// @brief Finds the providers matching a query in routing order.
    ///
    /// Providers whose breaker is open (and not yet due for recovery) are excluded unless the query
    /// asks for them. Checking availability may move an open breaker to half-open. Providers are never
    /// called from here, health checks are left to the buses as they need a bounded wait. The result is
    /// ordered by effective priority, priority group and registration order.
    std::vector<ProviderRecord> GetProviders(const ProviderQuery& query);

    /// @brief Every available provider of a type, in routing order. Used for broadcasts.
    std::vector<ProviderRecord> GetAllProviders(ServiceType type);

    /// @brief Looks up one provider regardless of its availability.
    std::optional<ProviderRecord> GetProvider(const ProviderHandle& handle) const;

    /// @brief Claims permission to call a provider, enforcing the half-open probe limit.
    /// @return false if the provider is unknown or its breaker refuses the call.
    bool TryAcquireProbe(const ProviderHandle& handle);

    /// @brief Gives back a probe whose call ended without a success or failure, such as a rate limited call.
    void ReleaseProbe(const ProviderHandle& handle);

    /// @brief Reports a successful call. Unknown handles are ignored.
    void RecordSuccess(const ProviderHandle& handle, std::chrono::microseconds latency);

    /// @brief Reports a failed or timed out call. Unknown handles are ignored.
    void RecordFailure(const ProviderHandle& handle);

    /// @brief Forces the breakers of one service type, or all of them, back to closed.
    ///
    /// This is an administrative operation and is always written to the audit log.
    /// @return The number of breakers reset.
    std::size_t ResetCircuitBreakers(std::optional<ServiceType> type = std::nullopt);

    [[nodiscard]] RegistrySnapshot Snapshot(std::optional<ServiceType> type = std::nullopt) const;

    [[nodiscard]] bool HasServiceType(ServiceType type) const;

    [[nodiscard]] std::size_t GetProviderCount(std::optional<ServiceType> type = std::nullopt) const;

    /// @brief Blocks until at least one provider is registered for every required type.
    /// @return false if the timeout elapsed first.
    bool WaitReady(std::span<const ServiceType> requiredTypes, std::chrono::milliseconds timeout);

    /// @brief Removes every provider.
    void Clear();

    [[nodiscard]] const std::shared_ptr<AuditLog>& GetAuditLog() const noexcept
    {
      return m_auditLog;
    }

    [[nodiscard]] const ClockFunction& GetClock() const noexcept
    {
      return m_clock;
    }

  private:
    std::shared_ptr<ProviderEntry> TryFindEntry(const ProviderHandle& handle) const;
    bool HasAllServiceTypes(std::span<const ServiceType> requiredTypes) const;
  };
}

#endif
