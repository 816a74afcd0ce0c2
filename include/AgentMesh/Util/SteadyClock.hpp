#ifndef AGENTMESH_UTIL_STEADYCLOCK_HPP
#define AGENTMESH_UTIL_STEADYCLOCK_HPP
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
#include <functional>

namespace AgentMesh
{
  using SteadyClock = std::chrono::steady_clock;

  /// @brief Time source used by components that measure elapsed time.
  ///
  /// Injected so tests can advance time without sleeping.
  using ClockFunction = std::function<SteadyClock::time_point()>;

  inline ClockFunction DefaultClock()
  {
    return []() { return SteadyClock::now(); };
  }
}

#endif
