// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "xstream/core/logger.hpp"
#include "xstream/network/transport.hpp"
#include "xstream/protocol/bootstrap.hpp"
#include "xstream/protocol/protocol.hpp"

namespace xstream
{
namespace protocol
{

/// \brief Named constructor arguments handed to protocols that accept them.
using NamedArguments = std::map<std::string, std::string>;

/// \brief Builds one protocol instance per connection.
template <typename Payload> class ProtocolFactory
{
public:
  virtual ~ProtocolFactory() = default;

  virtual std::shared_ptr<Protocol<Payload>>
  buildProtocol(const network::ConnectionInfo &info) = 0;
};

/// \brief Factory that constructs \p ProtocolT from arguments captured when the
/// factory was created and installs its bootstraps on every instance.
///
/// Each buildProtocol() call constructs a fresh ProtocolT from copies of the
/// stored arguments, points the instance back at this factory, and installs
/// the bootstrap list as it is at that moment. When ProtocolT has a
/// constructor taking the positional arguments followed by a
/// `const NamedArguments &`, the stored named arguments are passed last.
///
/// \code
/// XmlStreamFactoryMixin<MyProtocol, std::string, int> factory("realm", 5);
/// factory.addBootstrap(STREAM_START_EVENT, onStart);
/// auto proto = factory.build(info); // MyProtocol("realm", 5)
/// \endcode
template <typename ProtocolT, typename... Args>
class XmlStreamFactoryMixin : public ProtocolFactory<typename ProtocolT::PayloadType>,
                              public BootstrapMixin<typename ProtocolT::PayloadType>
{
public:
  using Payload = typename ProtocolT::PayloadType;

  static_assert(std::is_base_of_v<Protocol<Payload>, ProtocolT>,
                "ProtocolT must derive from xstream::protocol::Protocol");

  explicit XmlStreamFactoryMixin(Args... args) : _args(std::move(args)...) {}

  XmlStreamFactoryMixin(Args... args, NamedArguments named)
    : _args(std::move(args)...), _named(std::move(named))
  {
    static_assert(acceptsNamedArguments,
                  "ProtocolT has no constructor taking named arguments");
  }

  /// \brief Typed variant of buildProtocol().
  std::shared_ptr<ProtocolT> build(const network::ConnectionInfo &info)
  {
    std::shared_ptr<ProtocolT> proto = std::apply(
      [this](const auto &...a)
      {
        if constexpr (acceptsNamedArguments)
        {
          return std::make_shared<ProtocolT>(a..., _named);
        }
        else
        {
          return std::make_shared<ProtocolT>(a...);
        }
      },
      _args);
    proto->setFactory(this);
    proto->setConnectionInfo(info);
    this->installBootstraps(*proto);
    XSTREAM_LOG_DEBUG("XmlStreamFactory: built protocol for session "
                      << info.sessionId << " (" << network::roleToString(info.role) << ", "
                      << this->bootstraps().size() << " bootstraps)");
    return proto;
  }

  std::shared_ptr<Protocol<Payload>> buildProtocol(const network::ConnectionInfo &info) override
  {
    return build(info);
  }

  /// \brief Arguments every built protocol is constructed with.
  const std::tuple<Args...> &arguments() const { return _args; }

  const NamedArguments &namedArguments() const { return _named; }

private:
  static constexpr bool acceptsNamedArguments =
    std::is_constructible_v<ProtocolT, const Args &..., const NamedArguments &>;

  std::tuple<Args...> _args;
  NamedArguments _named;
};

} // namespace protocol
} // namespace xstream
