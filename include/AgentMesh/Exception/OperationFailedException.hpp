#ifndef AGENTMESH_EXCEPTION_OPERATIONFAILEDEXCEPTION_HPP
#define AGENTMESH_EXCEPTION_OPERATIONFAILEDEXCEPTION_HPP
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

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace AgentMesh
{
  /// @brief The failure of one provider during a routed operation.
  struct ProviderFailure
  {
    std::string ProviderName;
    std::string Message;
    bool TimedOut{false};
  };

  /// @brief Exception thrown when every attempted provider failed.
  class OperationFailedException : public std::runtime_error
  {
    std::vector<ProviderFailure> m_failures;

  public:
    explicit OperationFailedException(const std::string& message)
      : std::runtime_error(message)
    {
    }

    OperationFailedException(const std::string& message, std::vector<ProviderFailure> failures)
      : std::runtime_error(message)
      , m_failures(std::move(failures))
    {
    }

    /// @brief The failures in the order the providers were attempted.
    [[nodiscard]] const std::vector<ProviderFailure>& GetFailures() const noexcept
    {
      return m_failures;
    }
  };
}

#endif
