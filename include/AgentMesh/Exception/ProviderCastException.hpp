#ifndef AGENTMESH_EXCEPTION_PROVIDERCASTEXCEPTION_HPP
#define AGENTMESH_EXCEPTION_PROVIDERCASTEXCEPTION_HPP
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
#include <typeinfo>
#include <utility>

namespace AgentMesh
{
  /// @brief Exception thrown when a provider instance can not be cast to the requested interface.
  class ProviderCastException : public std::bad_cast
  {
    std::string m_message;

  public:
    explicit ProviderCastException(std::string message)
      : m_message(std::move(message))
    {
    }

    const char* what() const noexcept override
    {
      return m_message.c_str();
    }
  };
}

#endif
