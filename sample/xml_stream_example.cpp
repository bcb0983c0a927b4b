/// \file xml_stream_example.cpp
/// \brief Two XML streams talking over an in-memory loopback connection.
///
/// The sample builds a server-side and a client-side XmlStream from two
/// XmlStreamFactory instances and wires them together with a transport that
/// hands every write straight to the other side's dataReceived(). It shows
/// how to:
///
/// - Load parser limits and logger settings from a TOML file with
///   `ConfigLoader` (pass the path as the first argument).
/// - Register bootstrap observers on a factory so every stream it builds
///   reacts to `stream-start`, `stream-end` and element selectors.
/// - Answer a stream header with our own header and echo `<message/>`
///   stanzas back to the peer.
/// - Close the document from the client and watch both sides end.

#include "xstream/xstream.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

using namespace xstream;

namespace
{
const char *const STREAM_NS = "http://etherx.jabber.org/streams";

/// Delivers writes to the peer stream and closes both ends together.
class LoopbackTransport : public network::ITransport
{
public:
  void bind(std::weak_ptr<xml::XmlStream> local, std::weak_ptr<xml::XmlStream> peer)
  {
    _local = std::move(local);
    _peer = std::move(peer);
  }

  void write(std::string_view data) override
  {
    if (auto peer = _peer.lock())
    {
      peer->dataReceived(data);
    }
  }

  void loseConnection() override
  {
    if (auto local = _local.lock())
    {
      local->connectionLost(std::string("connection closed"));
    }
    if (auto peer = _peer.lock())
    {
      peer->connectionLost(std::string("closed by peer"));
    }
  }

private:
  std::weak_ptr<xml::XmlStream> _local;
  std::weak_ptr<xml::XmlStream> _peer;
};

xml::Element streamHeader(const std::string &from)
{
  xml::Element header("stream:stream");
  header.setAttribute("xmlns:stream", STREAM_NS);
  header.setAttribute("xmlns", "jabber:client");
  header.setAttribute("from", from);
  return header;
}

void logEnd(const char *side, const xml::StreamPayload &payload)
{
  if (auto *failure = std::get_if<xml::StreamFailure>(&payload))
  {
    XSTREAM_LOG_INFO(side << " stream ended: " << failure->toString());
  }
  else
  {
    XSTREAM_LOG_INFO(side << " stream ended");
  }
}
} // namespace

int main(int argc, char **argv)
{
  xml::ParserOptions options;
  if (argc > 1)
  {
    try
    {
      core::ConfigLoader config(argv[1]);
      config.configureLogger();
      options = config.parserOptions();
    }
    catch (const std::runtime_error &e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  }

  std::shared_ptr<xml::XmlStream> server;
  std::shared_ptr<xml::XmlStream> client;

  xml::XmlStreamFactory serverFactory(options);
  serverFactory.addBootstrap(xml::STREAM_START_EVENT,
                             [&](const xml::StreamPayload &payload)
                             {
                               const auto &root = std::get<xml::ElementPtr>(payload);
                               XSTREAM_LOG_INFO("server: peer opened <" << root->name() << "> from "
                                                                        << root->attribute("from"));
                               server->send(streamHeader("server.example").openTag());
                             });
  serverFactory.addBootstrap(xml::elementSelector("message"),
                             [&](const xml::StreamPayload &payload)
                             {
                               const auto &msg = std::get<xml::ElementPtr>(payload);
                               xml::Element reply("message");
                               reply.setAttribute("to", std::string(msg->attribute("from")));
                               std::string text;
                               if (auto body = msg->firstChildElement("body"))
                               {
                                 text = body->textContent();
                               }
                               reply.addElement("body")->addText("echo: " + text);
                               server->send(reply);
                             });
  serverFactory.addBootstrap(xml::STREAM_END_EVENT, [](const xml::StreamPayload &payload)
                             { logEnd("server", payload); });

  xml::XmlStreamFactory clientFactory(options);
  clientFactory.addBootstrap(xml::STREAM_START_EVENT, [](const xml::StreamPayload &payload)
                             {
                               XSTREAM_LOG_INFO("client: server answered with <"
                                                << std::get<xml::ElementPtr>(payload)->name()
                                                << ">");
                             });
  clientFactory.addBootstrap(xml::elementSelector("message"),
                             [&](const xml::StreamPayload &payload)
                             {
                               const auto &msg = std::get<xml::ElementPtr>(payload);
                               std::cout << "client received: " << msg->toXml() << std::endl;
                               client->send("</stream:stream>");
                             });
  clientFactory.addBootstrap(xml::STREAM_END_EVENT, [](const xml::StreamPayload &payload)
                             { logEnd("client", payload); });

  network::ConnectionInfo serverInfo{1, network::Role::ServerPeer, "127.0.0.1", 5222};
  network::ConnectionInfo clientInfo{2, network::Role::ClientConnected, "127.0.0.1", 5222};
  server = serverFactory.build(serverInfo);
  client = clientFactory.build(clientInfo);

  auto serverTransport = std::make_shared<LoopbackTransport>();
  auto clientTransport = std::make_shared<LoopbackTransport>();
  serverTransport->bind(server, client);
  clientTransport->bind(client, server);
  server->makeConnection(serverTransport);
  client->makeConnection(clientTransport);

  try
  {
    client->send(streamHeader("client@example").openTag());

    xml::Element hello("message");
    hello.setAttribute("from", "client@example");
    hello.addElement("body")->addText("hello <world> & friends");
    client->send(hello);
  }
  catch (const std::exception &e)
  {
    XSTREAM_LOG_ERROR("observer failed: " << e.what());
    return EXIT_FAILURE;
  }

  std::cout << "server state: " << xml::streamStateToString(server->state()) << std::endl;
  std::cout << "client state: " << xml::streamStateToString(client->state()) << std::endl;
  return EXIT_SUCCESS;
}
