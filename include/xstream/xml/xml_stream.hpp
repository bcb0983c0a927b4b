// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "xstream/core/logger.hpp"
#include "xstream/protocol/protocol.hpp"
#include "xstream/xml/incremental_parser.hpp"

namespace xstream
{
namespace xml
{

/// Selectors dispatched by XmlStream
inline constexpr char STREAM_CONNECTED_EVENT[] = "stream-connected";
inline constexpr char STREAM_START_EVENT[] = "stream-start";
inline constexpr char STREAM_ERROR_EVENT[] = "stream-error";
inline constexpr char STREAM_END_EVENT[] = "stream-end";
inline constexpr char STREAM_ELEMENT_EVENT[] = "stream-element";

/// \brief Selector under which a completed child named \p qualifiedName is
/// dispatched, e.g. "/message".
inline std::string elementSelector(std::string_view qualifiedName)
{
  std::string sel;
  sel.reserve(qualifiedName.size() + 1);
  sel.push_back('/');
  sel.append(qualifiedName.data(), qualifiedName.size());
  return sel;
}

enum class FailureKind
{
  ParseError,
  ConnectionLost
};

/// \brief Why a stream failed or ended.
struct StreamFailure
{
  FailureKind kind{FailureKind::ParseError};
  std::string message;
  std::size_t line{0};   ///< ParseError only
  std::size_t column{0}; ///< ParseError only
  std::size_t offset{0}; ///< ParseError only

  bool isParseError() const { return kind == FailureKind::ParseError; }

  std::string toString() const
  {
    if (kind == FailureKind::ConnectionLost)
    {
      return "connection lost: " + message;
    }
    return "parse error at line " + std::to_string(line) + ", column " + std::to_string(column) +
           ": " + message;
  }
};

/// \brief Payload of every XmlStream event.
///  - stream-connected: empty
///  - stream-start: the root element
///  - element selectors: the completed element
///  - stream-error: StreamFailure (ParseError)
///  - stream-end: StreamFailure, or empty when the connection closed without a reason
using StreamPayload = std::variant<std::monostate, ElementPtr, StreamFailure>;

enum class StreamState
{
  Idle,
  AwaitingRoot,
  InStream,
  Errored,
  Ended
};

inline const char *streamStateToString(StreamState state)
{
  switch (state)
  {
  case StreamState::Idle:
    return "Idle";
  case StreamState::AwaitingRoot:
    return "AwaitingRoot";
  case StreamState::InStream:
    return "InStream";
  case StreamState::Errored:
    return "Errored";
  case StreamState::Ended:
    return "Ended";
  default:
    return "Unknown";
  }
}

/// \brief XML stream protocol: one unbounded root element per connection.
///
/// Lifecycle:
///
///   Idle -> AwaitingRoot -> InStream -> Ended
///                 \            |
///                  +--> Errored --> Ended
///
/// - connectionMade(): Idle -> AwaitingRoot, dispatches stream-connected.
/// - Root start tag: dispatches stream-start with the root element.
/// - Each closed child of the root: dispatched under "/<qname>" and then
///   under stream-element (or handed to the function set with setDispatchFn()).
/// - Root end tag: the peer finished; asks the transport to close.
/// - Malformed input: stream-error then stream-end, always both, in that
///   order, within the same dataReceived() call. stream-end carries the
///   failure unless a stream-error observer closed the connection first.
/// - connectionLost(): stream-end, once.
///
/// Observers may call back into send(), dataReceived() and connectionLost()
/// while being dispatched.
class XmlStream : public protocol::Protocol<StreamPayload>
{
public:
  using ElementHandler = std::function<void(const ElementPtr &)>;
  using RawDataHandler = std::function<void(std::string_view)>;

  explicit XmlStream(const ParserOptions &options = ParserOptions{}) : _parser(options) {}
  ~XmlStream() override = default;

  XmlStream(const XmlStream &) = delete;
  XmlStream &operator=(const XmlStream &) = delete;

  StreamState state() const { return _state; }

  /// \brief Root element of the current stream; null before stream-start.
  const ElementPtr &root() const { return _root; }

  const ParserOptions &options() const { return _parser.options(); }

  void connectionMade() override
  {
    if (_state != StreamState::Idle)
    {
      XSTREAM_LOG_WARN("XmlStream: connectionMade() ignored in state "
                       << streamStateToString(_state));
      return;
    }
    _parser.reset();
    _root.reset();
    _pending.clear();
    _state = StreamState::AwaitingRoot;
    XSTREAM_LOG_DEBUG("XmlStream: connection made, awaiting root element");
    dispatch(StreamPayload{}, STREAM_CONNECTED_EVENT);
  }

  void dataReceived(std::string_view data) override
  {
    if (_state != StreamState::AwaitingRoot && _state != StreamState::InStream)
    {
      XSTREAM_LOG_DEBUG("XmlStream: ignoring " << data.size() << " bytes in state "
                                               << streamStateToString(_state));
      return;
    }
    if (_rawDataIn)
    {
      _rawDataIn(data);
    }

    _pending.append(data.data(), data.size());
    if (_processing)
    {
      // Called from an observer; the outer call picks this up in order
      return;
    }

    ProcessingGuard guard(_processing);
    while (!_pending.empty() && isActive())
    {
      std::string chunk;
      chunk.swap(_pending);
      processChunk(chunk);
    }
  }

  void connectionLost(std::optional<std::string> reason = std::nullopt) override
  {
    if (_state == StreamState::Ended)
    {
      XSTREAM_LOG_DEBUG("XmlStream: connectionLost() on ended stream ignored");
      return;
    }
    XSTREAM_LOG_INFO("XmlStream: connection lost" << (reason ? ": " + *reason : std::string()));
    StreamPayload payload;
    if (reason)
    {
      StreamFailure failure;
      failure.kind = FailureKind::ConnectionLost;
      failure.message = *reason;
      payload = std::move(failure);
    }
    endStream(payload);
  }

  /// \brief Write \p data verbatim to the transport.
  /// \return false, without writing, before connectionMade(), after the stream
  /// has ended, or when no transport is attached.
  bool send(std::string_view data)
  {
    if (_state == StreamState::Idle || _state == StreamState::Ended)
    {
      XSTREAM_LOG_DEBUG("XmlStream: send() dropped " << data.size() << " bytes in state "
                                                     << streamStateToString(_state));
      return false;
    }
    if (!_transport)
    {
      XSTREAM_LOG_WARN("XmlStream: send() without a transport");
      return false;
    }
    if (_rawDataOut)
    {
      _rawDataOut(data);
    }
    _transport->write(data);
    return true;
  }

  /// \brief Serialize \p element and send it.
  bool send(const Element &element) { return send(element.toXml()); }

  /// \brief Route completed children to \p fn instead of the dispatcher.
  void setDispatchFn(ElementHandler fn) { _elementHandler = std::move(fn); }

  /// \brief Route completed children to the dispatcher again.
  void resetDispatchFn() { _elementHandler = nullptr; }

  /// \brief Observe every chunk passed to dataReceived() before parsing.
  void setRawDataInFn(RawDataHandler fn) { _rawDataIn = std::move(fn); }

  /// \brief Observe every chunk written by send().
  void setRawDataOutFn(RawDataHandler fn) { _rawDataOut = std::move(fn); }

private:
  struct ProcessingGuard
  {
    explicit ProcessingGuard(bool &flag) : _flag(flag) { _flag = true; }
    ~ProcessingGuard() { _flag = false; }
    bool &_flag;
  };

  bool isActive() const
  {
    return _state == StreamState::AwaitingRoot || _state == StreamState::InStream;
  }

  void processChunk(std::string_view chunk)
  {
    std::vector<ParseEvent> events = _parser.feed(chunk);
    for (auto &ev : events)
    {
      if (!isActive())
      {
        // An observer ended the stream; drop whatever this chunk still held
        _pending.clear();
        return;
      }
      std::visit(
        [this](auto &e)
        {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, RootOpened>)
          {
            onRootOpened(e.root);
          }
          else if constexpr (std::is_same_v<T, ChildCompleted>)
          {
            onElement(e.element);
          }
          else if constexpr (std::is_same_v<T, RootClosed>)
          {
            onRootClosed();
          }
          else
          {
            onParseFailure(e);
          }
        },
        ev);
    }
  }

  void onRootOpened(const ElementPtr &root)
  {
    _root = root;
    _state = StreamState::InStream;
    XSTREAM_LOG_DEBUG("XmlStream: stream started with <" << root->name() << ">");
    dispatch(StreamPayload{root}, STREAM_START_EVENT);
  }

  void onElement(const ElementPtr &element)
  {
    if (_elementHandler)
    {
      // Copy; the handler may replace itself
      ElementHandler handler = _elementHandler;
      handler(element);
      return;
    }
    StreamPayload payload{element};
    dispatch(payload, elementSelector(element->name()));
    if (isActive())
    {
      dispatch(payload, STREAM_ELEMENT_EVENT);
    }
  }

  void onRootClosed()
  {
    XSTREAM_LOG_INFO("XmlStream: peer closed the stream document");
    if (_transport)
    {
      _transport->loseConnection();
    }
  }

  void onParseFailure(const ParseFailure &pf)
  {
    _state = StreamState::Errored;
    _pending.clear();

    StreamFailure failure;
    failure.kind = FailureKind::ParseError;
    failure.message = pf.message;
    failure.line = pf.line;
    failure.column = pf.column;
    failure.offset = pf.offset;
    XSTREAM_LOG_WARN("XmlStream: " << failure.toString());

    std::exception_ptr firstError;
    try
    {
      dispatch(StreamPayload{failure}, STREAM_ERROR_EVENT);
    }
    catch (const std::exception &e)
    {
      XSTREAM_LOG_ERROR("XmlStream: stream-error observer failed: " << e.what());
      firstError = std::current_exception();
    }
    catch (...)
    {
      XSTREAM_LOG_ERROR("XmlStream: stream-error observer failed with a non-standard exception");
      firstError = std::current_exception();
    }

    // A stream-error observer may already have closed the connection, which
    // ended the stream through connectionLost()
    if (_state != StreamState::Ended)
    {
      try
      {
        endStream(StreamPayload{failure});
      }
      catch (...)
      {
        XSTREAM_LOG_ERROR("XmlStream: stream-end observer failed after a parse error");
        if (!firstError)
        {
          firstError = std::current_exception();
        }
      }

      if (_transport)
      {
        _transport->loseConnection();
      }
    }
    if (firstError)
    {
      std::rethrow_exception(firstError);
    }
  }

  // Enter Ended before dispatching so that re-entrant connectionLost() calls
  // from stream-end observers are no-ops.
  void endStream(const StreamPayload &payload)
  {
    _state = StreamState::Ended;
    _pending.clear();
    dispatch(payload, STREAM_END_EVENT);
  }

  IncrementalXmlParser _parser;
  StreamState _state{StreamState::Idle};
  ElementPtr _root;
  std::string _pending;
  bool _processing{false};
  ElementHandler _elementHandler;
  RawDataHandler _rawDataIn;
  RawDataHandler _rawDataOut;
};

} // namespace xml
} // namespace xstream
