#ifndef AGENTMESH_BUS_PROVIDERINVOKER_HPP
#define AGENTMESH_BUS_PROVIDERINVOKER_HPP
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

#include <AgentMesh/Exception/OperationTimeoutException.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace AgentMesh
{
  struct ProviderInvokerConfig
  {
    /// @brief Number of threads executing provider calls.
    uint32_t ThreadCount{8};

    void Validate() const
    {
      if (ThreadCount == 0)
      {
        throw std::invalid_argument("ProviderInvokerConfig: ThreadCount must be at least 1");
      }
    }
  };

  /// @brief A provider call running on the invoker pool.
  template <typename TResult>
  struct PendingCall
  {
    std::future<TResult> Result;
    /// @brief Requesting stop tells the provider its result is no longer wanted.
    std::stop_source StopSource;
  };

  /// @brief Runs blocking provider calls on a shared thread pool so callers can bound their wait.
  ///
  /// A provider that ignores its stop token keeps its pool thread until it returns; the pool is
  /// joined on destruction.
  class ProviderInvoker
  {
    boost::asio::thread_pool m_pool;
    std::atomic<uint32_t> m_inFlight{0};
    std::atomic<uint64_t> m_timeouts{0};

  public:
    explicit ProviderInvoker(const ProviderInvokerConfig& config = {});
    ~ProviderInvoker();

    ProviderInvoker(const ProviderInvoker&) = delete;
    ProviderInvoker& operator=(const ProviderInvoker&) = delete;
    ProviderInvoker(ProviderInvoker&&) = delete;
    ProviderInvoker& operator=(ProviderInvoker&&) = delete;

    /// @brief Starts a call without waiting for it.
    /// @param call Callable taking a std::stop_token and returning TResult.
    template <typename TResult, typename TCall>
    PendingCall<TResult> Launch(TCall call)
    {
      auto promise = std::make_shared<std::promise<TResult>>();
      PendingCall<TResult> pending{promise->get_future(), std::stop_source()};

      ++m_inFlight;
      boost::asio::post(m_pool,
                        [this, promise, stopToken = pending.StopSource.get_token(), call = std::move(call)]() mutable
                        {
                          try
                          {
                            promise->set_value(call(stopToken));
                          }
                          catch (...)
                          {
                            promise->set_exception(std::current_exception());
                          }
                          --m_inFlight;
                        });
      return pending;
    }

    /// @brief Performs a call and waits at most timeout for its result.
    /// @throws OperationTimeoutException if the call did not finish in time. The call is asked to stop.
    /// @throws Whatever the call threw.
    template <typename TResult, typename TCall>
    TResult Invoke(const std::string_view providerName, TCall call, const std::chrono::milliseconds timeout)
    {
      auto pending = Launch<TResult>(std::move(call));
      if (pending.Result.wait_for(timeout) != std::future_status::ready)
      {
        pending.StopSource.request_stop();
        ++m_timeouts;
        throw OperationTimeoutException(fmt::format("Provider '{}' did not respond within {}ms", providerName, timeout.count()),
                                        std::string(providerName), timeout);
      }
      return pending.Result.get();
    }

    /// @brief Number of calls that have been launched and not yet returned.
    [[nodiscard]] uint32_t GetInFlightCount() const noexcept
    {
      return m_inFlight.load();
    }

    [[nodiscard]] uint64_t GetTimeoutCount() const noexcept
    {
      return m_timeouts.load();
    }

    /// @brief Records a timeout detected by a caller that waited on a launched call itself.
    void NotifyTimeout() noexcept
    {
      ++m_timeouts;
    }
  };
}

#endif
