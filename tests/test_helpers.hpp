// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for xstream test suite
// This file contains common utilities used across multiple test files

#pragma once

#include "xstream/xstream.hpp"
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xstream::test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { xstream::core::Logger::setLevel(xstream::core::Logger::Level::Warning); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief In-memory transport that records every write.
///
/// When bound to a protocol, loseConnection() reports the close straight
/// back through connectionLost(), as a real transport eventually would.
class StringTransport : public xstream::network::ITransport
{
public:
  void write(std::string_view data) override { writes.emplace_back(data); }

  void loseConnection() override
  {
    ++loseConnectionCalls;
    if (protocol)
    {
      protocol->connectionLost(std::string("no reason"));
    }
  }

  std::string value() const
  {
    std::string all;
    for (const auto &w : writes)
    {
      all += w;
    }
    return all;
  }

  std::vector<std::string> writes;
  int loseConnectionCalls{0};
  xstream::protocol::Protocol<xstream::xml::StreamPayload> *protocol{nullptr};
};

/// \brief Connect \p stream to a fresh StringTransport and return the transport.
inline std::shared_ptr<StringTransport> connect(xstream::xml::XmlStream &stream)
{
  auto transport = std::make_shared<StringTransport>();
  transport->protocol = &stream;
  stream.makeConnection(transport);
  return transport;
}

/// \brief Protocol with an event dispatcher and no further processing; it
/// records the arguments it was constructed with.
class DummyProtocol : public xstream::protocol::Protocol<xstream::xml::StreamPayload>
{
public:
  DummyProtocol() = default;
  DummyProtocol(std::string name, int retries) : name(std::move(name)), retries(retries) {}
  DummyProtocol(std::string name, const xstream::protocol::NamedArguments &kwargs)
    : name(std::move(name)), kwargs(kwargs)
  {
  }

  std::string name;
  int retries{0};
  xstream::protocol::NamedArguments kwargs;
};

/// \brief Remove a file if it exists.
inline void removeFile(const std::string &path) { std::remove(path.c_str()); }

} // namespace xstream::test
