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

#include <AgentMesh/Bus/ProviderInvoker.hpp>
#include <spdlog/spdlog.h>

namespace AgentMesh
{
  namespace
  {
    std::size_t ValidatedThreadCount(const ProviderInvokerConfig& config)
    {
      config.Validate();
      return config.ThreadCount;
    }
  }

  ProviderInvoker::ProviderInvoker(const ProviderInvokerConfig& config)
    : m_pool(ValidatedThreadCount(config))
  {
    spdlog::debug("ProviderInvoker: started {} worker thread(s)", config.ThreadCount);
  }

  ProviderInvoker::~ProviderInvoker()
  {
    const uint32_t inFlight = m_inFlight.load();
    if (inFlight > 0)
    {
      spdlog::warn("ProviderInvoker: waiting for {} provider call(s) still running", inFlight);
    }
    m_pool.join();
  }
}
