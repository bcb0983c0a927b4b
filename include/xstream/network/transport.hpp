// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xstream
{
namespace network
{

using SessionId = std::uint64_t;

enum class Role
{
  ServerPeer,
  ClientConnected
};

inline const char *roleToString(Role role)
{
  switch (role)
  {
  case Role::ServerPeer:
    return "ServerPeer";
  case Role::ClientConnected:
    return "ClientConnected";
  default:
    return "Unknown";
  }
}

/// \brief What the connection layer knows about a connection when it asks a
/// factory for a protocol.
struct ConnectionInfo
{
  SessionId sessionId{0};
  Role role{Role::ClientConnected};
  std::string host;
  std::uint16_t port{0};
};

/// \brief Byte transport as seen by a protocol.
///
/// write() queues bytes for the peer and returns immediately. loseConnection()
/// asks the transport to close; the transport reports the close back by
/// calling the protocol's connectionLost(), possibly from within this call.
class ITransport
{
public:
  virtual ~ITransport() = default;

  virtual void write(std::string_view data) = 0;
  virtual void loseConnection() = 0;
};

} // namespace network
} // namespace xstream
