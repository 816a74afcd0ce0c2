#ifndef AGENTMESH_EXCEPTION_OPERATIONTIMEOUTEXCEPTION_HPP
#define AGENTMESH_EXCEPTION_OPERATIONTIMEOUTEXCEPTION_HPP
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

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace AgentMesh
{
  /// @brief Exception thrown when a provider call exceeds its time bound.
  ///
  /// A timeout is recorded as exactly one circuit breaker failure for the provider.
  class OperationTimeoutException : public std::runtime_error
  {
    std::string m_providerName;
    std::chrono::milliseconds m_timeout;

  public:
    OperationTimeoutException(const std::string& message, std::string providerName, const std::chrono::milliseconds timeout)
      : std::runtime_error(message)
      , m_providerName(std::move(providerName))
      , m_timeout(timeout)
    {
    }

    [[nodiscard]] const std::string& GetProviderName() const noexcept
    {
      return m_providerName;
    }

    [[nodiscard]] std::chrono::milliseconds GetTimeout() const noexcept
    {
      return m_timeout;
    }
  };
}

#endif
