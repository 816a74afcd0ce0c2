#ifndef AGENTMESH_SERVICE_COMMUNICATIONTYPES_HPP
#define AGENTMESH_SERVICE_COMMUNICATIONTYPES_HPP
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
#include <string>

namespace AgentMesh
{
  /// @brief A message read back from a channel.
  struct FetchedMessage
  {
    std::string MessageId;
    std::string ChannelId;
    std::string AuthorId;
    std::string AuthorName;
    std::string Content;
    std::chrono::system_clock::time_point Timestamp{};
    bool IsBot{false};
  };
}

#endif
