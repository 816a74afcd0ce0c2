#ifndef AGENTMESH_SERVICE_ISERVICE_HPP
#define AGENTMESH_SERVICE_ISERVICE_HPP
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

#include <string>
#include <vector>

namespace AgentMesh
{
  /// @brief Base interface implemented by every provider.
  ///
  /// A provider additionally implements the typed interface of the service type it is registered
  /// for (ICommunicationService, IToolService, ILlmService, IWiseAuthorityService or
  /// IRuntimeControlService). The registry verifies this on registration.
  class IService
  {
  public:
    virtual ~IService() = default;

    /// @brief The name the provider is registered under unless the registration overrides it.
    virtual std::string GetName() const = 0;

    /// @brief The capabilities (operation names) the provider supports.
    virtual std::vector<std::string> GetCapabilities() const = 0;

    /// @brief Providers reporting unhealthy are skipped by the buses.
    virtual bool IsHealthy() const
    {
      return true;
    }
  };
}

#endif
