#ifndef AGENTMESH_EXCEPTION_PROVIDERRATELIMITEDEXCEPTION_HPP
#define AGENTMESH_EXCEPTION_PROVIDERRATELIMITEDEXCEPTION_HPP
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
#include <optional>
#include <stdexcept>
#include <string>

namespace AgentMesh
{
  /// @brief Thrown by a provider to signal that it is rate limited.
  ///
  /// The bus puts the provider into a cooldown instead of recording a circuit breaker failure.
  class ProviderRateLimitedException : public std::runtime_error
  {
    std::optional<std::chrono::milliseconds> m_retryAfter;

  public:
    explicit ProviderRateLimitedException(const std::string& message, const std::optional<std::chrono::milliseconds> retryAfter = std::nullopt)
      : std::runtime_error(message)
      , m_retryAfter(retryAfter)
    {
    }

    /// @brief The retry hint given by the provider, if any.
    [[nodiscard]] std::optional<std::chrono::milliseconds> GetRetryAfter() const noexcept
    {
      return m_retryAfter;
    }
  };
}

#endif
