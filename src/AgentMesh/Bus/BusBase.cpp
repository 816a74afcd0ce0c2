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
#include <AgentMesh/Exception/BusStoppedException.hpp>
#include <AgentMesh/Log/LogHelper.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <future>
#include <utility>

namespace AgentMesh
{
  BusBase::BusBase(const ServiceType serviceType, ServiceRegistry& registry, ProviderInvoker& invoker, const BusConfig& config)
    : m_serviceType(serviceType)
    , m_config(config)
    , m_logger(Log::GetLogger(fmt::format("{}_bus", ToString(serviceType))))
    , m_registry(registry)
    , m_invoker(invoker)
  {
    m_config.Validate();
  }

  BusBase::~BusBase()
  {
    if (m_thread.joinable())
    {
      m_logger->warn("BusBase: bus destroyed while running, abandoning queued messages");
      Stop(std::chrono::milliseconds(0));
    }
  }

  void BusBase::Start()
  {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_running)
    {
      return;
    }

    m_ioContext = std::make_unique<boost::asio::io_context>();
    m_workGuard.emplace(boost::asio::make_work_guard(*m_ioContext));
    m_running = true;
    m_accepting = true;
    m_thread = std::thread([this]() { RunLoop(); });
    m_logger->info("{} bus started (capacity {})", ToString(m_serviceType), m_config.QueueCapacity);
  }

  bool BusBase::Stop()
  {
    return Stop(m_config.DrainTimeout);
  }

  bool BusBase::Stop(const std::chrono::milliseconds grace)
  {
    bool drained = true;
    {
      std::unique_lock<std::mutex> lock(m_stateMutex);
      if (!m_running)
      {
        return true;
      }
      m_accepting = false;
      drained = m_drainCondition.wait_for(lock, grace, [this]() { return m_pending == 0; });
    }

    // Without the work guard run() returns as soon as the queue is empty
    m_workGuard.reset();
    if (!drained)
    {
      m_ioContext->stop();
    }
    if (m_thread.joinable())
    {
      m_thread.join();
    }

    std::size_t abandoned = 0;
    {
      std::lock_guard<std::mutex> lock(m_stateMutex);
      abandoned = m_pending;
      m_failed += abandoned;
      m_pending = 0;
      m_running = false;
    }
    // Destroys the handlers that never ran
    m_ioContext.reset();

    if (abandoned > 0)
    {
      m_logger->warn("{} bus stopped after {}ms grace period, abandoned {} message(s)", ToString(m_serviceType), grace.count(), abandoned);
    }
    else
    {
      m_logger->info("{} bus stopped", ToString(m_serviceType));
    }
    return abandoned == 0;
  }

  bool BusBase::IsRunning() const
  {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_running;
  }

  BusStats BusBase::GetStats() const
  {
    BusStats stats;
    stats.Type = m_serviceType;
    {
      std::lock_guard<std::mutex> lock(m_stateMutex);
      stats.QueueSize = m_pending;
      stats.Processed = m_processed;
      stats.Failed = m_failed;
      stats.Dropped = m_dropped;
      stats.Running = m_running;
    }
    CollectMetrics(stats.Metrics);
    return stats;
  }

  bool BusBase::TryEnqueue(std::unique_ptr<BusMessage> message)
  {
    if (!message)
    {
      throw std::invalid_argument("BusBase::TryEnqueue: message can not be null");
    }
    if (message->CorrelationId.empty())
    {
      message->CorrelationId = NextCorrelationId();
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_accepting)
    {
      ++m_dropped;
      m_logger->warn("{} bus is not accepting messages, dropped message {} from '{}'", ToString(m_serviceType), message->CorrelationId,
                     message->HandlerName);
      return false;
    }
    if (m_pending >= m_config.QueueCapacity)
    {
      ++m_dropped;
      ++m_failed;
      m_logger->warn("{} bus queue full ({}), dropped message {} from '{}'", ToString(m_serviceType), m_config.QueueCapacity,
                     message->CorrelationId, message->HandlerName);
      return false;
    }

    ++m_pending;
    std::shared_ptr<BusMessage> shared(std::move(message));
    boost::asio::post(*m_ioContext, [this, shared]() { RunMessage(shared); });
    return true;
  }

  void BusBase::EnsureRunning(const std::string_view operation) const
  {
    if (!IsRunning())
    {
      throw BusStoppedException(fmt::format("{}: the {} bus is not running", operation, ToString(m_serviceType)));
    }
  }

  std::string BusBase::NextCorrelationId()
  {
    return fmt::format("{}-{}", ToString(m_serviceType), m_nextCorrelationId.fetch_add(1));
  }

  std::vector<ProviderRecord> BusBase::FindProviders(ProviderQuery query, const ProviderLookup lookup)
  {
    query.Type = m_serviceType;
    auto providers = m_registry.GetProviders(query);
    if (query.IncludeUnavailable || providers.empty())
    {
      return providers;
    }

    std::vector<PendingCall<bool>> checks;
    checks.reserve(providers.size());
    for (const auto& provider : providers)
    {
      checks.push_back(m_invoker.Launch<bool>([instance = provider.Instance](std::stop_token /*stopToken*/) { return instance->IsHealthy(); }));
    }

    const auto deadline = SteadyClock::now() + m_config.CallTimeout;
    std::vector<ProviderRecord> healthy;
    healthy.reserve(providers.size());
    for (std::size_t i = 0; i < providers.size(); ++i)
    {
      auto& check = checks[i];
      bool isHealthy = false;
      if (check.Result.wait_until(deadline) != std::future_status::ready)
      {
        check.StopSource.request_stop();
        m_invoker.NotifyTimeout();
        m_logger->warn("FindProviders: health check of '{}' did not answer within {}ms", providers[i].Name, m_config.CallTimeout.count());
      }
      else
      {
        try
        {
          isHealthy = check.Result.get();
        }
        catch (const std::exception& ex)
        {
          m_logger->warn("FindProviders: health check of '{}' threw: {}", providers[i].Name, ex.what());
        }
      }

      if (isHealthy)
      {
        healthy.push_back(std::move(providers[i]));
      }
      else
      {
        m_logger->warn("FindProviders: skipping '{}', provider is not healthy", providers[i].Name);
        if (lookup == ProviderLookup::Call)
        {
          m_registry.RecordFailure(providers[i].Handle);
        }
      }
    }
    return healthy;
  }

  void BusBase::RunLoop()
  {
    try
    {
      m_ioContext->run();
    }
    catch (const std::exception& ex)
    {
      m_logger->error("{} bus consumer loop terminated: {}", ToString(m_serviceType), ex.what());
    }
  }

  void BusBase::RunMessage(const std::shared_ptr<BusMessage>& message)
  {
    bool success = false;
    try
    {
      ProcessMessage(*message);
      success = true;
    }
    catch (const std::exception& ex)
    {
      m_logger->error("{} bus failed to process message {} from '{}': {}", ToString(m_serviceType), message->CorrelationId,
                      message->HandlerName, ex.what());
    }
    catch (...)
    {
      m_logger->error("{} bus failed to process message {} from '{}': unknown exception", ToString(m_serviceType), message->CorrelationId,
                      message->HandlerName);
    }

    {
      std::lock_guard<std::mutex> lock(m_stateMutex);
      if (success)
      {
        ++m_processed;
      }
      else
      {
        ++m_failed;
      }
      --m_pending;
    }
    m_drainCondition.notify_all();
  }
}
