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

#include <AgentMesh/Exception/DuplicateProviderRegistrationException.hpp>
#include <AgentMesh/Exception/InvalidProviderException.hpp>
#include <AgentMesh/Log/LogHelper.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <AgentMesh/Resilience/CircuitBreaker.hpp>
#include <AgentMesh/Service/ICommunicationService.hpp>
#include <AgentMesh/Service/ILlmService.hpp>
#include <AgentMesh/Service/IRuntimeControlService.hpp>
#include <AgentMesh/Service/IToolService.hpp>
#include <AgentMesh/Service/IWiseAuthorityService.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace AgentMesh
{
  namespace
  {
    AGENTMESH_LOGGER_NAME(ServiceRegistry);

    using CapabilitySet = std::set<std::string, std::less<>>;

    bool ImplementsServiceInterface(const ServiceType type, const IService& provider)
    {
      switch (type)
      {
      case ServiceType::Communication:
        return dynamic_cast<const ICommunicationService*>(&provider) != nullptr;
      case ServiceType::Tool:
        return dynamic_cast<const IToolService*>(&provider) != nullptr;
      case ServiceType::Llm:
        return dynamic_cast<const ILlmService*>(&provider) != nullptr;
      case ServiceType::WiseAuthority:
        return dynamic_cast<const IWiseAuthorityService*>(&provider) != nullptr;
      case ServiceType::RuntimeControl:
        return dynamic_cast<const IRuntimeControlService*>(&provider) != nullptr;
      }
      return false;
    }

    bool HasCapabilities(const CapabilitySet& capabilities, const std::vector<std::string>& required)
    {
      return std::all_of(required.begin(), required.end(),
                         [&capabilities](const std::string& capability) { return capabilities.find(capability) != capabilities.end(); });
    }

    uint8_t Promote(const uint8_t priorityValue) noexcept
    {
      return priorityValue > 0 ? static_cast<uint8_t>(priorityValue - 1) : uint8_t(0);
    }
  }

  struct ServiceRegistry::ProviderEntry
  {
    ProviderHandle Handle;
    std::string Name;
    std::shared_ptr<IService> Instance;
    ServicePriority Priority;
    ServicePriorityGroup PriorityGroup;
    CapabilitySet Capabilities;
    SelectionStrategy Strategy;
    ProviderMetadata Metadata;
    uint64_t RegistrationOrder;
    CircuitBreaker Breaker;

    mutable std::mutex MetricsMutex;
    ProviderMetrics Metrics;

    ProviderEntry(const ProviderHandle handle, ServiceRegistration&& registration, std::string name, CapabilitySet capabilities,
                  const uint64_t registrationOrder, const ClockFunction& clock)
      : Handle(handle)
      , Name(std::move(name))
      , Instance(std::move(registration.Provider))
      , Priority(registration.Priority)
      , PriorityGroup(registration.PriorityGroup)
      , Capabilities(std::move(capabilities))
      , Strategy(registration.Strategy)
      , Metadata(std::move(registration.Metadata))
      , RegistrationOrder(registrationOrder)
      , Breaker(fmt::format("{}/{}", ToString(handle.GetServiceType()), Name), registration.BreakerConfig, clock)
    {
    }

    ProviderRecord ToRecord(const uint8_t effectivePriority) const
    {
      ProviderRecord record;
      record.Handle = Handle;
      record.Name = Name;
      record.Instance = Instance;
      record.Priority = Priority;
      record.EffectivePriority = effectivePriority;
      record.PriorityGroup = PriorityGroup;
      record.Capabilities = Capabilities;
      record.Strategy = Strategy;
      record.Metadata = Metadata;
      record.RegistrationOrder = RegistrationOrder;
      record.BreakerState = Breaker.GetState();
      {
        std::lock_guard<std::mutex> lock(MetricsMutex);
        record.Metrics = Metrics;
      }
      return record;
    }

    void AddSuccess(const std::chrono::microseconds latency, const SteadyClock::time_point now)
    {
      std::lock_guard<std::mutex> lock(MetricsMutex);
      ++Metrics.TotalRequests;
      Metrics.ConsecutiveFailures = 0;
      Metrics.LastRequestTime = now;

      const double latencyMs = static_cast<double>(latency.count()) / 1000.0;
      ++Metrics.LatencySamples;
      Metrics.AverageLatencyMs += (latencyMs - Metrics.AverageLatencyMs) / static_cast<double>(Metrics.LatencySamples);
    }

    void AddFailure(const SteadyClock::time_point now)
    {
      std::lock_guard<std::mutex> lock(MetricsMutex);
      ++Metrics.TotalRequests;
      ++Metrics.FailedRequests;
      ++Metrics.ConsecutiveFailures;
      Metrics.LastRequestTime = now;
      Metrics.LastFailureTime = now;
    }
  };

  ServiceRegistry::ServiceRegistry(std::shared_ptr<AuditLog> auditLog, ClockFunction clock)
    : m_auditLog(auditLog ? std::move(auditLog) : std::make_shared<AuditLog>())
    , m_clock(clock ? std::move(clock) : DefaultClock())
  {
  }

  ServiceRegistry::~ServiceRegistry() = default;

  ProviderHandle ServiceRegistry::Register(ServiceRegistration registration)
  {
    if (!registration.Provider)
    {
      spdlog::error("ServiceRegistry::Register: provider is null");
      throw InvalidProviderException(fmt::format("Can not register a null provider for service type '{}'", ToString(registration.Type)));
    }

    std::string name = registration.Name.empty() ? registration.Provider->GetName() : registration.Name;
    if (name.empty())
    {
      spdlog::error("ServiceRegistry::Register: provider name is empty");
      throw InvalidProviderException(fmt::format("Can not register a provider without a name for service type '{}'", ToString(registration.Type)));
    }

    if (!ImplementsServiceInterface(registration.Type, *registration.Provider))
    {
      spdlog::error("ServiceRegistry::Register: provider '{}' does not implement the '{}' interface", name, ToString(registration.Type));
      throw InvalidProviderException(
        fmt::format("Provider '{}' does not implement the interface required by service type '{}'", name, ToString(registration.Type)));
    }

    try
    {
      registration.BreakerConfig.Validate();
    }
    catch (const std::invalid_argument& ex)
    {
      throw InvalidProviderException(fmt::format("Provider '{}' has an invalid circuit breaker config: {}", name, ex.what()));
    }

    const std::vector<std::string> declared =
      registration.Capabilities.empty() ? registration.Provider->GetCapabilities() : registration.Capabilities;
    CapabilitySet capabilities(declared.begin(), declared.end());

    const ServiceType type = registration.Type;
    const ServicePriority priority = registration.Priority;
    ProviderHandle handle;
    {
      std::unique_lock lock(m_mutex);
      auto& entries = m_providers[type];
      const auto existing = std::find_if(entries.begin(), entries.end(), [&name](const auto& entry) { return entry->Name == name; });
      if (existing != entries.end())
      {
        spdlog::error("ServiceRegistry::Register: provider '{}' is already registered for '{}'", name, ToString(type));
        throw DuplicateProviderRegistrationException(fmt::format("Provider '{}' is already registered for service type '{}'", name, ToString(type)));
      }

      handle = ProviderHandle(type, m_nextId++);
      entries.push_back(std::make_shared<ProviderEntry>(handle, std::move(registration), name, std::move(capabilities), m_nextRegistrationOrder++, m_clock));
    }

    Log::GetLogger<LoggerName_ServiceRegistry>()->info("Registered {} provider '{}' with priority {} (id {})", ToString(type), name,
                                                       ToString(priority), handle.GetId());

    {
      // Lock so a waiter can not miss the notification between its predicate check and its wait
      std::lock_guard<std::mutex> readyLock(m_readyMutex);
    }
    m_readyCondition.notify_all();
    return handle;
  }

  bool ServiceRegistry::Unregister(const ProviderHandle& handle)
  {
    std::shared_ptr<ProviderEntry> removed;
    {
      std::unique_lock lock(m_mutex);
      auto itr = m_providers.find(handle.GetServiceType());
      if (itr == m_providers.end())
      {
        return false;
      }
      auto& entries = itr->second;
      auto found = std::find_if(entries.begin(), entries.end(), [&handle](const auto& entry) { return entry->Handle == handle; });
      if (found == entries.end())
      {
        return false;
      }
      removed = *found;
      entries.erase(found);
      if (entries.empty())
      {
        m_providers.erase(itr);
      }
    }
    Log::GetLogger<LoggerName_ServiceRegistry>()->info("Unregistered {} provider '{}'", ToString(handle.GetServiceType()), removed->Name);
    return true;
  }

  bool ServiceRegistry::Unregister(const ServiceType type, const std::string& name)
  {
    ProviderHandle handle;
    {
      std::shared_lock lock(m_mutex);
      auto itr = m_providers.find(type);
      if (itr == m_providers.end())
      {
        return false;
      }
      const auto found = std::find_if(itr->second.begin(), itr->second.end(), [&name](const auto& entry) { return entry->Name == name; });
      if (found == itr->second.end())
      {
        return false;
      }
      handle = (*found)->Handle;
    }
    return Unregister(handle);
  }

  std::vector<ProviderRecord> ServiceRegistry::GetProviders(const ProviderQuery& query)
  {
    std::vector<std::pair<std::shared_ptr<ProviderEntry>, uint8_t>> candidates;
    {
      std::shared_lock lock(m_mutex);
      auto itr = m_providers.find(query.Type);
      if (itr == m_providers.end())
      {
        return {};
      }
      for (const auto& entry : itr->second)
      {
        if (!HasCapabilities(entry->Capabilities, query.RequiredCapabilities))
        {
          continue;
        }
        uint8_t effectivePriority = GetPriorityValue(entry->Priority);
        if (query.Domain.has_value())
        {
          const auto domain = GetMetadataValue(entry->Metadata, MetadataKeys::Domain, MetadataValues::GeneralDomain);
          if (domain == *query.Domain)
          {
            effectivePriority = Promote(effectivePriority);
          }
          else if (domain != MetadataValues::GeneralDomain)
          {
            continue;
          }
        }
        candidates.emplace_back(entry, effectivePriority);
      }
    }

    // Breakers take their own lock, so availability is checked after the registry lock is released
    auto logger = Log::GetLogger<LoggerName_ServiceRegistry>();
    std::vector<ProviderRecord> result;
    result.reserve(candidates.size());
    for (const auto& [entry, effectivePriority] : candidates)
    {
      if (!query.IncludeUnavailable && !entry->Breaker.IsAvailable())
      {
        logger->debug("GetProviders: skipping '{}', circuit breaker is open", entry->Name);
        continue;
      }
      result.push_back(entry->ToRecord(effectivePriority));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const ProviderRecord& lhs, const ProviderRecord& rhs)
                     {
                       if (lhs.EffectivePriority != rhs.EffectivePriority)
                       {
                         return lhs.EffectivePriority < rhs.EffectivePriority;
                       }
                       if (lhs.PriorityGroup != rhs.PriorityGroup)
                       {
                         return lhs.PriorityGroup < rhs.PriorityGroup;
                       }
                       return lhs.RegistrationOrder < rhs.RegistrationOrder;
                     });
    return result;
  }

  std::vector<ProviderRecord> ServiceRegistry::GetAllProviders(const ServiceType type)
  {
    ProviderQuery query;
    query.Type = type;
    return GetProviders(query);
  }

  std::optional<ProviderRecord> ServiceRegistry::GetProvider(const ProviderHandle& handle) const
  {
    auto entry = TryFindEntry(handle);
    if (!entry)
    {
      return std::nullopt;
    }
    return entry->ToRecord(GetPriorityValue(entry->Priority));
  }

  bool ServiceRegistry::TryAcquireProbe(const ProviderHandle& handle)
  {
    auto entry = TryFindEntry(handle);
    return entry && entry->Breaker.TryAcquireProbe();
  }

  void ServiceRegistry::ReleaseProbe(const ProviderHandle& handle)
  {
    auto entry = TryFindEntry(handle);
    if (entry)
    {
      entry->Breaker.ReleaseProbe();
    }
  }

  void ServiceRegistry::RecordSuccess(const ProviderHandle& handle, const std::chrono::microseconds latency)
  {
    auto entry = TryFindEntry(handle);
    if (!entry)
    {
      spdlog::debug("ServiceRegistry::RecordSuccess: provider {} is no longer registered", handle.GetId());
      return;
    }
    entry->Breaker.RecordSuccess();
    entry->AddSuccess(latency, m_clock());
  }

  void ServiceRegistry::RecordFailure(const ProviderHandle& handle)
  {
    auto entry = TryFindEntry(handle);
    if (!entry)
    {
      spdlog::debug("ServiceRegistry::RecordFailure: provider {} is no longer registered", handle.GetId());
      return;
    }
    entry->Breaker.RecordFailure();
    entry->AddFailure(m_clock());
  }

  std::size_t ServiceRegistry::ResetCircuitBreakers(const std::optional<ServiceType> type)
  {
    EntryList entries;
    {
      std::shared_lock lock(m_mutex);
      for (const auto& [entryType, list] : m_providers)
      {
        if (!type.has_value() || *type == entryType)
        {
          entries.insert(entries.end(), list.begin(), list.end());
        }
      }
    }

    for (const auto& entry : entries)
    {
      entry->Breaker.Reset();
    }

    AuditEvent event;
    event.Type = AuditEventType::CircuitBreakerReset;
    event.Subject = type.has_value() ? std::string(ToString(*type)) : std::string("all");
    event.Detail = fmt::format("reset {} circuit breaker(s)", entries.size());
    m_auditLog->Record(std::move(event));
    return entries.size();
  }

  RegistrySnapshot ServiceRegistry::Snapshot(const std::optional<ServiceType> type) const
  {
    RegistrySnapshot snapshot;
    std::shared_lock lock(m_mutex);
    for (const auto& [entryType, list] : m_providers)
    {
      if (type.has_value() && *type != entryType)
      {
        continue;
      }

      EntryList ordered(list);
      std::stable_sort(ordered.begin(), ordered.end(),
                       [](const auto& lhs, const auto& rhs)
                       {
                         if (lhs->Priority != rhs->Priority)
                         {
                           return GetPriorityValue(lhs->Priority) < GetPriorityValue(rhs->Priority);
                         }
                         if (lhs->PriorityGroup != rhs->PriorityGroup)
                         {
                           return lhs->PriorityGroup < rhs->PriorityGroup;
                         }
                         return lhs->RegistrationOrder < rhs->RegistrationOrder;
                       });

      auto& providers = snapshot.Providers[entryType];
      providers.reserve(ordered.size());
      for (const auto& entry : ordered)
      {
        ProviderSnapshot provider;
        provider.Name = entry->Name;
        provider.Priority = entry->Priority;
        provider.PriorityGroup = entry->PriorityGroup;
        provider.Capabilities.assign(entry->Capabilities.begin(), entry->Capabilities.end());
        provider.Strategy = entry->Strategy;
        provider.Metadata = entry->Metadata;
        provider.Breaker = entry->Breaker.GetStats();
        {
          std::lock_guard<std::mutex> metricsLock(entry->MetricsMutex);
          provider.Metrics = entry->Metrics;
        }
        providers.push_back(std::move(provider));
      }
    }
    return snapshot;
  }

  bool ServiceRegistry::HasServiceType(const ServiceType type) const
  {
    std::shared_lock lock(m_mutex);
    auto itr = m_providers.find(type);
    return itr != m_providers.end() && !itr->second.empty();
  }

  std::size_t ServiceRegistry::GetProviderCount(const std::optional<ServiceType> type) const
  {
    std::shared_lock lock(m_mutex);
    std::size_t count = 0;
    for (const auto& [entryType, list] : m_providers)
    {
      if (!type.has_value() || *type == entryType)
      {
        count += list.size();
      }
    }
    return count;
  }

  bool ServiceRegistry::WaitReady(const std::span<const ServiceType> requiredTypes, const std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(m_readyMutex);
    const bool ready = m_readyCondition.wait_for(lock, timeout, [this, requiredTypes]() { return HasAllServiceTypes(requiredTypes); });
    if (!ready)
    {
      for (const ServiceType type : requiredTypes)
      {
        if (!HasServiceType(type))
        {
          spdlog::warn("ServiceRegistry::WaitReady: no provider registered for '{}' after {}ms", ToString(type), timeout.count());
        }
      }
    }
    return ready;
  }

  void ServiceRegistry::Clear()
  {
    std::size_t count = 0;
    {
      std::unique_lock lock(m_mutex);
      for (const auto& entry : m_providers)
      {
        count += entry.second.size();
      }
      m_providers.clear();
    }
    Log::GetLogger<LoggerName_ServiceRegistry>()->info("Cleared {} provider(s)", count);
  }

  std::shared_ptr<ServiceRegistry::ProviderEntry> ServiceRegistry::TryFindEntry(const ProviderHandle& handle) const
  {
    std::shared_lock lock(m_mutex);
    auto itr = m_providers.find(handle.GetServiceType());
    if (itr == m_providers.end())
    {
      return nullptr;
    }
    const auto found = std::find_if(itr->second.begin(), itr->second.end(), [&handle](const auto& entry) { return entry->Handle == handle; });
    return found != itr->second.end() ? *found : nullptr;
  }

  bool ServiceRegistry::HasAllServiceTypes(const std::span<const ServiceType> requiredTypes) const
  {
    return std::all_of(requiredTypes.begin(), requiredTypes.end(), [this](const ServiceType type) { return HasServiceType(type); });
  }
}
