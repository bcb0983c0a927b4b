// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "xstream/network/transport.hpp"
#include "xstream/util/event_dispatcher.hpp"

namespace xstream
{
namespace protocol
{

template <typename Payload> class ProtocolFactory;

/// \brief Base for protocols driven by a connection layer.
///
/// A protocol is an event dispatcher bound to one connection. The connection
/// layer calls makeConnection() (or sets a transport and calls
/// connectionMade()), then dataReceived() for every chunk, then
/// connectionLost() once. The default callbacks do nothing.
///
/// \tparam Payload event payload type of the embedded dispatcher
template <typename Payload> class Protocol : public util::EventDispatcher<Payload>
{
public:
  using PayloadType = Payload;

  Protocol() = default;
  ~Protocol() override = default;

  /// \brief Attach \p transport and signal connectionMade().
  void makeConnection(std::shared_ptr<network::ITransport> transport)
  {
    _transport = std::move(transport);
    connectionMade();
  }

  virtual void connectionMade() {}
  virtual void dataReceived(std::string_view data) { (void)data; }
  virtual void connectionLost(std::optional<std::string> reason = std::nullopt) { (void)reason; }

  void setTransport(std::shared_ptr<network::ITransport> transport)
  {
    _transport = std::move(transport);
  }
  const std::shared_ptr<network::ITransport> &transport() const { return _transport; }

  /// \brief Factory that built this protocol; non-owning, may be null.
  ProtocolFactory<Payload> *factory() const { return _factory; }
  void setFactory(ProtocolFactory<Payload> *factory) { _factory = factory; }

  const network::ConnectionInfo &connectionInfo() const { return _connectionInfo; }
  void setConnectionInfo(const network::ConnectionInfo &info) { _connectionInfo = info; }

protected:
  std::shared_ptr<network::ITransport> _transport;

private:
  ProtocolFactory<Payload> *_factory{nullptr};
  network::ConnectionInfo _connectionInfo;
};

} // namespace protocol
} // namespace xstream
