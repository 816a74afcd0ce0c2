#ifndef AGENTMESH_REGISTRY_PROVIDERMETADATA_HPP
#define AGENTMESH_REGISTRY_PROVIDERMETADATA_HPP
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

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace AgentMesh
{
  /// @brief Free form key/value data declared on registration (for example "domain" or "model").
  using ProviderMetadata = std::map<std::string, std::string, std::less<>>;

  namespace MetadataKeys
  {
    /// @brief The routing domain of a provider.
    inline constexpr std::string_view Domain = "domain";
    /// @brief Channel prefix a communication provider is responsible for.
    inline constexpr std::string_view ChannelPrefix = "channel_prefix";
  }

  namespace MetadataValues
  {
    /// @brief Domain assumed when a provider declares none. General providers serve every domain.
    inline constexpr std::string_view GeneralDomain = "general";
  }

  /// @brief Looks up a metadata value.
  /// @return The value, or defaultValue if the key is missing.
  inline std::string_view GetMetadataValue(const ProviderMetadata& metadata, const std::string_view key, const std::string_view defaultValue)
  {
    const auto itr = metadata.find(key);
    return itr != metadata.end() ? std::string_view(itr->second) : defaultValue;
  }
}

#endif
