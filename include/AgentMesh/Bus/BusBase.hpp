#ifndef AGENTMESH_BUS_BUSBASE_HPP
#define AGENTMESH_BUS_BUSBASE_HPP
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

#include <AgentMesh/Bus/BusConfig.hpp>
#include <AgentMesh/Bus/BusMessage.hpp>
#include <AgentMesh/Bus/BusStats.hpp>
#include <AgentMesh/Bus/ProviderInvoker.hpp>
#include <AgentMesh/Bus/ProviderSelector.hpp>
#include <AgentMesh/Exception/OperationFailedException.hpp>
#include <AgentMesh/Exception/OperationTimeoutException.hpp>
#include <AgentMesh/Exception/ProviderCastException.hpp>
#include <AgentMesh/Exception/ProviderRateLimitedException.hpp>
#include <AgentMesh/Registry/ProviderQuery.hpp>
#include <AgentMesh/Registry/ProviderRecord.hpp>
#include <AgentMesh/Registry/ServiceRegistry.hpp>
#include <AgentMesh/Registry/ServiceType.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/logger.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace AgentMesh
{
  /// @brief Why a bus looks up providers.
  enum class ProviderLookup
  {
    /// @brief The providers will be called. A failed health check counts against the breaker.
    Call,
    /// @brief Informational listing only. Breakers are left untouched.
    Listing,
  };

  /// @brief The outcome of one provider in a fan-out.
  template <typename TResult>
  struct FanOutOutcome
  {
    ProviderRecord Provider;
    std::optional<TResult> Value;
    std::optional<std::string> Error;
    bool TimedOut{false};
    /// @brief Arrival order of successful results, starting at zero.
    uint64_t Sequence{0};
  };

  /// @brief Common machinery of the typed buses.
  ///
  /// A bus owns a FIFO queue processed by one consumer thread (an io_context kept alive by a work
  /// guard) and provides the provider selection and invocation helpers used by the synchronous
  /// operations of the derived buses. Synchronous operations run on the caller's thread and wait
  /// for the provider call on the shared ProviderInvoker.
  ///
  /// Derived classes must call Stop() in their destructor, as queued messages are dispatched
  /// to ProcessMessage.
  class BusBase
  {
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    ServiceType m_serviceType;
    BusConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    ProviderSelector m_selector;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_drainCondition;
    std::unique_ptr<boost::asio::io_context> m_ioContext;
    std::optional<WorkGuard> m_workGuard;
    std::thread m_thread;
    bool m_running{false};
    bool m_accepting{false};
    std::size_t m_pending{0};
    uint64_t m_processed{0};
    uint64_t m_failed{0};
    uint64_t m_dropped{0};
    std::atomic<uint64_t> m_nextCorrelationId{1};

  protected:
    ServiceRegistry& m_registry;
    ProviderInvoker& m_invoker;

  public:
    BusBase(ServiceType serviceType, ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config);
    virtual ~BusBase();

    BusBase(const BusBase&) = delete;
    BusBase& operator=(const BusBase&) = delete;
    BusBase(BusBase&&) = delete;
    BusBase& operator=(BusBase&&) = delete;

    /// @brief Starts the consumer thread. Starting a running bus does nothing.
    void Start();

    /// @brief Stops accepting messages, drains the queue within the configured DrainTimeout and stops the consumer thread.
    /// @return false if messages had to be abandoned.
    bool Stop();

    /// @brief Stops accepting messages, drains the queue within grace and stops the consumer thread.
    ///
    /// Messages still queued when the grace period ends are abandoned and counted as failed.
    /// @return false if messages had to be abandoned.
    bool Stop(std::chrono::milliseconds grace);

    [[nodiscard]] bool IsRunning() const;

    [[nodiscard]] BusStats GetStats() const;

    [[nodiscard]] ServiceType GetServiceType() const noexcept
    {
      return m_serviceType;
    }

    [[nodiscard]] const BusConfig& GetConfig() const noexcept
    {
      return m_config;
    }

  protected:
    /// @brief Handles one dequeued message on the consumer thread. Exceptions count the message as failed.
    virtual void ProcessMessage(BusMessage& message) = 0;

    /// @brief Adds bus specific counters to the stats.
    virtual void CollectMetrics(std::map<std::string, double>& /*metrics*/) const
    {
    }

    /// @brief Queues a message for the consumer thread without blocking.
    /// @return false if the bus is stopped or full. The message is dropped.
    bool TryEnqueue(std::unique_ptr<BusMessage> message);

    /// @throws BusStoppedException if the bus is not running.
    void EnsureRunning(std::string_view operation) const;

    std::string NextCorrelationId();

    const std::shared_ptr<spdlog::logger>& GetLogger() const noexcept
    {
      return m_logger;
    }

    /// @brief Queries the registry for the providers of this bus and drops the unhealthy ones.
    ///
    /// Health checks run concurrently on the invoker and share one CallTimeout deadline. A provider
    /// that reports unhealthy, throws or does not answer in time is skipped, and for a Call lookup
    /// it is recorded as one breaker failure.
    std::vector<ProviderRecord> FindProviders(ProviderQuery query, ProviderLookup lookup = ProviderLookup::Call);

    /// @brief Asks a provider for information with the configured CallTimeout. Its breaker is not touched.
    /// @return nullopt if the call threw or timed out.
    template <typename TResult, typename TCall>
    std::optional<TResult> QueryProvider(const ProviderRecord& provider, const std::string_view operation, TCall call) const
    {
      try
      {
        return m_invoker.Invoke<TResult>(provider.Name, std::move(call), m_config.CallTimeout);
      }
      catch (const std::exception& ex)
      {
        m_logger->warn("{}: provider '{}' failed: {}", operation, provider.Name, ex.what());
        return std::nullopt;
      }
    }

    /// @brief Calls a provider with the configured CallTimeout and reports the outcome to its breaker.
    ///
    /// A rate limited provider is neither a success nor a failure. A timeout is recorded as exactly one failure.
    template <typename TResult, typename TCall>
    TResult InvokeProvider(const ProviderRecord& provider, TCall call)
    {
      return InvokeProvider<TResult>(provider, std::move(call), m_config.CallTimeout);
    }

    template <typename TResult, typename TCall>
    TResult InvokeProvider(const ProviderRecord& provider, TCall call, const std::chrono::milliseconds timeout)
    {
      const auto start = SteadyClock::now();
      try
      {
        TResult result = m_invoker.Invoke<TResult>(provider.Name, std::move(call), timeout);
        m_registry.RecordSuccess(provider.Handle, std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start));
        return result;
      }
      catch (const ProviderRateLimitedException& ex)
      {
        m_registry.ReleaseProbe(provider.Handle);
        m_logger->warn("Provider '{}' is rate limited: {}", provider.Name, ex.what());
        throw;
      }
      catch (const std::exception& ex)
      {
        m_registry.RecordFailure(provider.Handle);
        m_logger->warn("Provider '{}' failed: {}", provider.Name, ex.what());
        throw;
      }
    }

    /// @brief Tries the candidates following their selection plan until one attempt succeeds.
    ///
    /// Fallback groups try their members in order, the other strategies make one attempt per tie
    /// group. Providers whose breaker refuses a probe are skipped without counting as an attempt.
    /// @param candidates Providers in registry order.
    /// @param operation Name used in log and error messages.
    /// @param attempt Performs the call, normally through InvokeProvider.
    /// @return nullopt if no provider could be attempted.
    /// @throws OperationFailedException if every attempt failed.
    template <typename TResult>
    std::optional<TResult> TryExecute(std::vector<ProviderRecord> candidates, const std::string_view operation,
                                      const std::function<TResult(const ProviderRecord&)>& attempt)
    {
      std::vector<ProviderFailure> failures;
      const auto plan = m_selector.BuildPlan(std::move(candidates), m_config.StrategyOverride);
      for (const auto& group : plan)
      {
        for (const auto& member : group.Members)
        {
          if (!m_registry.TryAcquireProbe(member.Handle))
          {
            m_logger->debug("{}: skipping '{}', circuit breaker refused the call", operation, member.Name);
            continue;
          }

          m_logger->debug("{}: trying '{}' ({})", operation, member.Name, ToString(group.Strategy));
          try
          {
            return attempt(member);
          }
          catch (const ProviderCastException& ex)
          {
            // Thrown before the provider was called, so nothing reported on the probe yet
            m_registry.RecordFailure(member.Handle);
            failures.push_back(ProviderFailure{member.Name, ex.what(), false});
          }
          catch (const OperationTimeoutException& ex)
          {
            failures.push_back(ProviderFailure{member.Name, ex.what(), true});
          }
          catch (const std::exception& ex)
          {
            failures.push_back(ProviderFailure{member.Name, ex.what(), false});
          }

          if (group.Strategy != SelectionStrategy::Fallback)
          {
            break;
          }
        }
      }

      if (failures.empty())
      {
        return std::nullopt;
      }
      m_logger->error("{}: all {} attempted provider(s) failed", operation, failures.size());
      throw OperationFailedException(fmt::format("{}: all {} attempted provider(s) failed", operation, failures.size()), std::move(failures));
    }

    /// @brief Calls every provider concurrently and collects what arrives before the timeout.
    ///
    /// Providers that have not answered when the timeout elapses are asked to stop, recorded as a
    /// failure and their late result is ignored.
    /// @param makeCall Produces the call for a provider: a callable taking a std::stop_token and returning TResult.
    template <typename TResult, typename TMakeCall>
    std::vector<FanOutOutcome<TResult>> FanOut(const std::vector<ProviderRecord>& providers, TMakeCall makeCall,
                                               const std::chrono::milliseconds timeout)
    {
      struct Arrival
      {
        TResult Value;
        uint64_t Sequence;
        std::chrono::microseconds Latency;
      };

      auto sequence = std::make_shared<std::atomic<uint64_t>>(0);
      std::vector<std::pair<ProviderRecord, PendingCall<Arrival>>> launched;
      launched.reserve(providers.size());
      for (const auto& provider : providers)
      {
        if (!m_registry.TryAcquireProbe(provider.Handle))
        {
          m_logger->debug("FanOut: skipping '{}', circuit breaker refused the call", provider.Name);
          continue;
        }
        std::optional<decltype(makeCall(provider))> preparedCall;
        try
        {
          preparedCall.emplace(makeCall(provider));
        }
        catch (const std::exception& ex)
        {
          m_registry.RecordFailure(provider.Handle);
          m_logger->warn("FanOut: could not prepare the call to '{}': {}", provider.Name, ex.what());
          continue;
        }
        launched.emplace_back(provider, m_invoker.Launch<Arrival>(
                                          [call = std::move(*preparedCall), sequence](std::stop_token stopToken) mutable
                                          {
                                            const auto start = SteadyClock::now();
                                            TResult value = call(stopToken);
                                            const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
                                            return Arrival{std::move(value), sequence->fetch_add(1), latency};
                                          }));
      }

      const auto deadline = SteadyClock::now() + timeout;
      std::vector<FanOutOutcome<TResult>> outcomes;
      outcomes.reserve(launched.size());
      for (auto& [provider, pending] : launched)
      {
        FanOutOutcome<TResult> outcome;
        outcome.Provider = provider;
        if (pending.Result.wait_until(deadline) != std::future_status::ready)
        {
          pending.StopSource.request_stop();
          m_invoker.NotifyTimeout();
          m_registry.RecordFailure(provider.Handle);
          m_logger->warn("FanOut: provider '{}' did not respond within {}ms", provider.Name, timeout.count());
          outcome.TimedOut = true;
          outcome.Error = fmt::format("Provider '{}' did not respond within {}ms", provider.Name, timeout.count());
        }
        else
        {
          try
          {
            Arrival arrival = pending.Result.get();
            m_registry.RecordSuccess(provider.Handle, arrival.Latency);
            outcome.Value = std::move(arrival.Value);
            outcome.Sequence = arrival.Sequence;
          }
          catch (const std::exception& ex)
          {
            m_registry.RecordFailure(provider.Handle);
            m_logger->warn("FanOut: provider '{}' failed: {}", provider.Name, ex.what());
            outcome.Error = ex.what();
          }
        }
        outcomes.push_back(std::move(outcome));
      }
      return outcomes;
    }

  private:
    void RunLoop();
    void RunMessage(const std::shared_ptr<BusMessage>& message);
  };
}

#endif
