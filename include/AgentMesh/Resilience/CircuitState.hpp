#ifndef AGENTMESH_RESILIENCE_CIRCUITSTATE_HPP
#define AGENTMESH_RESILIENCE_CIRCUITSTATE_HPP
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

#include <cstdint>
#include <string_view>

namespace AgentMesh
{
  /// @brief The three states of a provider circuit breaker.
  enum class CircuitState : uint8_t
  {
    /// @brief Normal operation, calls pass through.
    Closed,
    /// @brief Failing, calls are rejected until the recovery timeout elapses.
    Open,
    /// @brief Trial calls are allowed to detect recovery.
    HalfOpen,
  };

  constexpr std::string_view ToString(const CircuitState state) noexcept
  {
    switch (state)
    {
    case CircuitState::Closed:
      return "closed";
    case CircuitState::Open:
      return "open";
    case CircuitState::HalfOpen:
      return "half_open";
    }
    return "unknown";
  }
}

#endif
