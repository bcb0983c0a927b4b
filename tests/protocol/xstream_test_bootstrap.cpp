// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using xstream::network::ConnectionInfo;
using xstream::network::Role;
using xstream::protocol::BootstrapMixin;
using xstream::protocol::XmlStreamFactoryMixin;
using xstream::test::DummyProtocol;
using xstream::xml::StreamPayload;
using xstream::xml::XmlStream;
using xstream::xml::XmlStreamFactory;

TEST_CASE("BootstrapMixin installs observers on a dispatcher", "[bootstrap]")
{
  xstream::test::initializeTestLogging();
  BootstrapMixin<StreamPayload> mixin;
  xstream::util::EventDispatcher<StreamPayload> dispatcher;
  std::vector<std::string> called;

  auto obs = mixin.addBootstrap("//event/myevent", [&](const StreamPayload &) { called.push_back("first"); });

  SECTION("Installed bootstraps are invoked on dispatch")
  {
    mixin.installBootstraps(dispatcher);
    REQUIRE(dispatcher.dispatch(StreamPayload{}, "//event/myevent"));
    REQUIRE(called == std::vector<std::string>{"first"});
  }

  SECTION("Removed bootstraps are not installed")
  {
    mixin.removeBootstrap("//event/myevent", obs);
    mixin.installBootstraps(dispatcher);
    REQUIRE_FALSE(dispatcher.dispatch(StreamPayload{}, "//event/myevent"));
    REQUIRE(called.empty());
  }

  SECTION("Bootstraps install in the order they were added")
  {
    mixin.addBootstrap("//event/myevent", [&](const StreamPayload &) { called.push_back("second"); });
    mixin.installBootstraps(dispatcher);
    dispatcher.dispatch(StreamPayload{}, "//event/myevent");
    REQUIRE(called == std::vector<std::string>{"first", "second"});
  }

  SECTION("The same list may be installed on several dispatchers")
  {
    xstream::util::EventDispatcher<StreamPayload> other;
    mixin.installBootstraps(dispatcher);
    mixin.installBootstraps(other);
    dispatcher.dispatch(StreamPayload{}, "//event/myevent");
    other.dispatch(StreamPayload{}, "//event/myevent");
    REQUIRE(called.size() == 2);
    REQUIRE(mixin.bootstraps().size() == 1);
  }

  SECTION("Removal matches both selector and observer")
  {
    auto stranger = xstream::common::makeObserver<StreamPayload>([](const StreamPayload &) {});
    mixin.removeBootstrap("//event/other", obs);
    mixin.removeBootstrap("//event/myevent", stranger);
    REQUIRE(mixin.bootstraps().size() == 1);
  }

  SECTION("Duplicate pairs are kept and removed one at a time")
  {
    mixin.addBootstrap("//event/myevent", obs);
    REQUIRE(mixin.bootstraps().size() == 2);
    mixin.removeBootstrap("//event/myevent", obs);
    REQUIRE(mixin.bootstraps().size() == 1);
  }
}

TEST_CASE("XmlStreamFactoryMixin builds protocols", "[factory]")
{
  using Factory = XmlStreamFactoryMixin<DummyProtocol, std::string, int>;
  Factory factory("arg", 5);

  ConnectionInfo info;
  info.sessionId = 42;
  info.role = Role::ServerPeer;
  info.host = "127.0.0.1";
  info.port = 5222;

  SECTION("Constructor arguments are forwarded")
  {
    auto proto = factory.build(info);
    REQUIRE(proto->name == "arg");
    REQUIRE(proto->retries == 5);
    REQUIRE(std::get<0>(factory.arguments()) == "arg");
  }

  SECTION("The protocol knows its factory and connection")
  {
    auto proto = factory.build(info);
    REQUIRE(proto->factory() == &factory);
    REQUIRE(proto->connectionInfo().sessionId == 42);
    REQUIRE(proto->connectionInfo().host == "127.0.0.1");
    REQUIRE(proto->connectionInfo().port == 5222);
  }

  SECTION("Each call builds a fresh protocol")
  {
    auto a = factory.build(info);
    auto b = factory.build(info);
    REQUIRE(a != b);
  }

  SECTION("Bootstraps are installed on the built protocol")
  {
    int count = 0;
    factory.addBootstrap("//event/myevent", [&](const StreamPayload &) { ++count; });
    std::shared_ptr<xstream::protocol::Protocol<StreamPayload>> proto = factory.buildProtocol(info);
    proto->dispatch(StreamPayload{}, "//event/myevent");
    REQUIRE(count == 1);
  }

  SECTION("Bootstraps are copied at build time")
  {
    int count = 0;
    auto proto = factory.build(info);
    factory.addBootstrap("//event/myevent", [&](const StreamPayload &) { ++count; });
    proto->dispatch(StreamPayload{}, "//event/myevent");
    REQUIRE(count == 0);

    auto later = factory.build(info);
    later->dispatch(StreamPayload{}, "//event/myevent");
    REQUIRE(count == 1);
  }
}

TEST_CASE("XmlStreamFactoryMixin forwards named arguments", "[factory]")
{
  using Factory = XmlStreamFactoryMixin<DummyProtocol, std::string>;
  xstream::protocol::NamedArguments kwargs;
  kwargs["test"] = "";
  Factory factory("arg", kwargs);

  auto proto = factory.build(ConnectionInfo{});
  REQUIRE(proto->name == "arg");
  REQUIRE(proto->kwargs.size() == 1);
  REQUIRE(proto->kwargs.count("test") == 1);
  REQUIRE(factory.namedArguments() == kwargs);

  SECTION("Positional construction passes an empty map")
  {
    Factory plain("other");
    auto built = plain.build(ConnectionInfo{});
    REQUIRE(built->name == "other");
    REQUIRE(built->kwargs.empty());
  }
}

TEST_CASE("XmlStreamFactory builds XmlStream protocols", "[factory][xmlstream]")
{
  xstream::xml::ParserOptions opts;
  opts.maxDepth = 8;
  XmlStreamFactory factory(opts);
  REQUIRE(factory.options().maxDepth == 8);

  bool started = false;
  factory.addBootstrap(xstream::xml::STREAM_START_EVENT,
                       [&](const StreamPayload &) { started = true; });

  std::shared_ptr<XmlStream> stream = factory.build(ConnectionInfo{});
  REQUIRE(stream->factory() == &factory);
  REQUIRE(stream->options().maxDepth == 8);
  REQUIRE(stream->state() == xstream::xml::StreamState::Idle);

  auto transport = xstream::test::connect(*stream);
  stream->dataReceived("<stream:stream>");
  REQUIRE(started);
}
