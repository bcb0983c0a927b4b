// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "xstream/core/logger.hpp"
#include "xstream/parsers/xml.hpp"

namespace xstream
{
namespace xml
{

using Element = parsers::xml::Element;
using ElementPtr = parsers::xml::ElementPtr;
using ParserOptions = parsers::xml::Options;

/// \brief The root start tag has been read. The root carries its name and
/// attributes only; its children are reported separately.
struct RootOpened
{
  ElementPtr root;
};

/// \brief A direct child of the root has been closed, with its whole subtree.
struct ChildCompleted
{
  ElementPtr element;
};

/// \brief The root end tag has been read (or the root was self-closing).
struct RootClosed
{
};

/// \brief Malformed input. Terminal.
struct ParseFailure
{
  std::string message;
  std::size_t line{0};
  std::size_t column{0};
  std::size_t offset{0};
};

using ParseEvent = std::variant<RootOpened, ChildCompleted, RootClosed, ParseFailure>;

/// \brief Turns a byte stream delivered in arbitrary chunks into structural
/// events for a single-root document.
///
/// feed() returns every event the new bytes complete, in document order; an
/// empty result means the bytes did not complete anything yet. Once a
/// ParseFailure has been returned, every later feed() returns that same
/// failure and the input is not looked at.
class IncrementalXmlParser
{
public:
  explicit IncrementalXmlParser(const ParserOptions &options = ParserOptions{})
      : _tokenizer(options)
  {
  }

  std::vector<ParseEvent> feed(std::string_view chunk)
  {
    std::vector<ParseEvent> events;
    if (_failure)
    {
      events.emplace_back(*_failure);
      return events;
    }

    if (!_tokenizer.append(chunk))
    {
      failFromTokenizer(events);
      return events;
    }

    while (true)
    {
      parsers::xml::NextResult r = _tokenizer.next();
      if (r == parsers::xml::NextResult::NeedMore)
      {
        break;
      }
      if (r == parsers::xml::NextResult::Error)
      {
        failFromTokenizer(events);
        break;
      }
      if (!handleToken(_tokenizer.current(), events))
      {
        break;
      }
    }
    return events;
  }

  /// \brief Forget everything and expect a new document.
  void reset()
  {
    _tokenizer.reset();
    _root.reset();
    _open.clear();
    _failure.reset();
  }

  bool failed() const { return _failure.has_value(); }

  /// \brief The current root element, or null before RootOpened.
  const ElementPtr &root() const { return _root; }

  /// \brief Bytes waiting for the rest of an incomplete construct.
  std::size_t buffered() const { return _tokenizer.buffered(); }

  const ParserOptions &options() const { return _tokenizer.options(); }

private:
  bool handleToken(const parsers::xml::Token &tok, std::vector<ParseEvent> &events)
  {
    using parsers::xml::TokenKind;
    switch (tok.kind)
    {
    case TokenKind::StartElement:
    case TokenKind::EmptyElement:
    {
      parsers::xml::Error decodeErr;
      ElementPtr elem = parsers::xml::makeElement(tok, &decodeErr);
      if (!elem)
      {
        return fail(tok, "in attribute of <" + std::string(tok.name) + ">: " + decodeErr.message,
                    events);
      }
      bool empty = tok.kind == TokenKind::EmptyElement;
      if (!_root)
      {
        _root = elem;
        events.emplace_back(RootOpened{elem});
        if (empty)
        {
          events.emplace_back(RootClosed{});
        }
      }
      else if (_open.empty())
      {
        if (empty)
        {
          events.emplace_back(ChildCompleted{elem});
        }
        else
        {
          _open.push_back(elem);
        }
      }
      else
      {
        _open.back()->appendChild(elem);
        if (!empty)
        {
          _open.push_back(elem);
        }
      }
      return true;
    }
    case TokenKind::EndElement:
      if (_open.empty())
      {
        // The tokenizer guarantees balance, so this is the root closing
        events.emplace_back(RootClosed{});
      }
      else
      {
        ElementPtr closed = _open.back();
        _open.pop_back();
        if (_open.empty())
        {
          events.emplace_back(ChildCompleted{closed});
        }
      }
      return true;
    case TokenKind::Text:
    {
      if (_open.empty())
      {
        // Character data directly under the root (keep-alive whitespace)
        return true;
      }
      std::string decoded;
      parsers::xml::Error decodeErr;
      if (!parsers::xml::StreamTokenizer::decodeEntities(tok.text, decoded, &decodeErr))
      {
        return fail(tok, decodeErr.message, events);
      }
      _open.back()->addText(decoded);
      return true;
    }
    case TokenKind::CData:
      if (!_open.empty())
      {
        _open.back()->addText(tok.text);
      }
      return true;
    case TokenKind::Doctype:
      return fail(tok, "DOCTYPE is not allowed", events);
    case TokenKind::XmlDecl:
    case TokenKind::Comment:
    case TokenKind::ProcessingInstruction:
    case TokenKind::Invalid:
    default:
      return true;
    }
  }

  bool fail(const parsers::xml::Token &tok, const std::string &message,
            std::vector<ParseEvent> &events)
  {
    ParseFailure failure;
    failure.message = message;
    failure.line = tok.line;
    failure.column = tok.column;
    failure.offset = tok.offset;
    record(std::move(failure), events);
    return false;
  }

  void failFromTokenizer(std::vector<ParseEvent> &events)
  {
    ParseFailure failure;
    if (const parsers::xml::Error *e = _tokenizer.error())
    {
      failure.message = e->message;
      failure.line = e->line;
      failure.column = e->column;
      failure.offset = e->offset;
    }
    else
    {
      failure.message = "tokenizer rejected input";
    }
    record(std::move(failure), events);
  }

  void record(ParseFailure failure, std::vector<ParseEvent> &events)
  {
    XSTREAM_LOG_DEBUG("IncrementalXmlParser: " << failure.message << " at line " << failure.line
                                               << ", column " << failure.column);
    _failure = failure;
    _open.clear();
    events.emplace_back(std::move(failure));
  }

  parsers::xml::StreamTokenizer _tokenizer;
  ElementPtr _root;
  std::vector<ElementPtr> _open; ///< Open elements below the root, outermost first
  std::optional<ParseFailure> _failure;
};

} // namespace xml
} // namespace xstream
