#pragma once
/// \file xml.hpp
/// \brief Resumable, non-validating XML 1.0 tokenizer plus a lightweight element tree.
///
/// Design goals:
///  - Header-only, zero external deps
///  - Input may arrive in arbitrary chunks; a construct split across chunks is held back
///    until it is complete, and consumed bytes are discarded
///  - Non-validating (no DTD/XSD); safe-by-default (no external entity expansion)
///  - UTF-8 primary encoding; predefined entities + numeric char refs
///
/// Example:
/// \code
/// xstream::parsers::xml::StreamTokenizer tok;
/// tok.append("<root a=\"1\">hi &am");
/// tok.append("p; bye</root>");
/// while (tok.next() == xstream::parsers::xml::NextResult::Token)
/// {
///   const auto &t = tok.current();
///   // ...
/// }
/// if (tok.error()) { /* handle */ }
/// \endcode
///
/// SPDX-License-Identifier: MPL-2.0

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xstream
{
namespace parsers
{
namespace xml
{
/// \brief Token kinds produced by the tokenizer.
enum class TokenKind
{
  Invalid,
  XmlDecl,
  Doctype,
  StartElement,
  EndElement,
  EmptyElement,
  Text,
  CData,
  Comment,
  ProcessingInstruction
};

/// \brief Outcome of StreamTokenizer::next().
enum class NextResult
{
  Token,    ///< current() holds a complete token
  NeedMore, ///< the buffered input ends inside a construct; append() more
  Error     ///< malformed input; error() describes it, the tokenizer is terminal
};

/// \brief Error information for parse failures. offset is relative to the whole stream.
struct Error
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  std::string message;
};

/// \brief Tokenizer configuration and safety limits.
struct Options
{
  std::size_t maxDepth{256};                ///< Max element nesting depth
  std::size_t maxAttrsPerElement{256};      ///< Max attributes per element
  std::size_t maxNameLength{1024};          ///< Max length of element or attribute names
  std::size_t maxTextSpan{1u << 20};        ///< Max contiguous text span in bytes (1 MiB)
  std::size_t maxBufferedBytes{4u << 20};   ///< Max unconsumed input held back (4 MiB)
};

/// \brief Attribute view (name/value). Values are raw source slices; use decodeEntities().
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

/// \brief Token produced by the tokenizer. Views point into the tokenizer's buffer and stay
/// valid until the next call to append(), next() or reset().
struct Token
{
  TokenKind kind{TokenKind::Invalid};
  std::string_view name;             ///< For elements/PI/decl: raw name or target
  std::string_view text;             ///< For Text/Comment/CData/PI/Doctype: raw text slice
  std::vector<Attribute> attributes; ///< For StartElement/EmptyElement
  bool selfClosing{false};
  std::size_t depth{0};  ///< Element depth at this token (root element has depth 1)
  std::size_t offset{0}; ///< Stream offset of token start
  std::size_t line{1};
  std::size_t column{1};

  /// \brief Returns {prefix, localName} split from name (no URI resolution).
  std::pair<std::string_view, std::string_view> splitQName() const
  {
    std::size_t pos = name.find(':');
    if (pos == std::string_view::npos)
    {
      return {std::string_view{}, name};
    }
    return {name.substr(0, pos), name.substr(pos + 1)};
  }
};

/// \brief Tokenizer over input that arrives in pieces.
///
/// append() adds bytes; next() returns the next complete token, NeedMore when the
/// buffered bytes end in the middle of a construct, or Error. A token is only
/// produced once its closing delimiter has been seen, so tokens never depend on
/// where the input was split. Character data is reported as one Text token per
/// run between markup.
class StreamTokenizer
{
public:
  explicit StreamTokenizer(const Options &opt = Options{}) : _opt(opt) {}

  const Options &options() const { return _opt; }

  /// \brief Returns the current token after next() returned Token.
  const Token &current() const { return _token; }

  /// \brief Returns last error pointer if any (nullptr if none).
  const Error *error() const { return _hasError ? &_error : nullptr; }

  /// \brief Current element nesting depth.
  std::size_t depth() const { return _elementStack.size(); }

  /// \brief Bytes received but not yet turned into tokens.
  std::size_t buffered() const { return _buffer.size() - _cur; }

  /// \brief Total bytes consumed by produced tokens since construction or reset().
  std::size_t consumed() const { return _base + _cur; }

  /// \brief Discard all state and start over with an empty buffer.
  void reset()
  {
    _buffer.clear();
    _cur = 0;
    _base = 0;
    _line = 1;
    _col = 1;
    _token = Token{};
    _hasError = false;
    _error = Error{};
    _seenRoot = false;
    _elementStack.clear();
  }

  /// \brief Append a chunk. Returns false once the tokenizer is in the error state.
  bool append(std::string_view chunk)
  {
    if (_hasError)
    {
      return false;
    }
    compact();
    _buffer.append(chunk.data(), chunk.size());
    return true;
  }

  /// \brief Advance to the next complete token.
  NextResult next()
  {
    if (_hasError)
    {
      return NextResult::Error;
    }
    compact();

    std::size_t p = _cur;
    if (_elementStack.empty())
    {
      // Whitespace between prolog items is not character data
      while (p < _buffer.size() && isSpace(_buffer[p]))
      {
        ++p;
      }
      consumeTo(p);
    }
    if (p >= _buffer.size())
    {
      return NextResult::NeedMore;
    }

    Step step;
    if (_buffer[p] != '<')
    {
      step = readText(p);
    }
    else if (p + 1 >= _buffer.size())
    {
      return NextResult::NeedMore;
    }
    else
    {
      char n = _buffer[p + 1];
      if (n == '?')
      {
        step = readProcessingInstruction(p);
      }
      else if (n == '/')
      {
        step = readEndTag(p);
      }
      else if (n == '!')
      {
        step = readMarkupDeclaration(p);
      }
      else
      {
        step = readStartOrEmptyTag(p);
      }
    }

    switch (step)
    {
    case Step::Done:
      return NextResult::Token;
    case Step::Incomplete:
      // Only bytes held back for an unfinished construct count against the limit
      if (buffered() > _opt.maxBufferedBytes)
      {
        fail(_cur, "buffered input limit exceeded");
        return NextResult::Error;
      }
      return NextResult::NeedMore;
    case Step::Failed:
    default:
      return NextResult::Error;
    }
  }

  /// \brief Decode predefined entities and numeric char refs in a slice.
  static bool decodeEntities(std::string_view in, std::string &out, Error *err = nullptr)
  {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size();)
    {
      char ch = in[i];
      if (ch != '&')
      {
        out.push_back(ch);
        ++i;
        continue;
      }
      std::size_t semi = in.find(';', i + 1);
      if (semi == std::string_view::npos)
      {
        if (err)
        {
          *err = {i, 0, 0, "unterminated entity"};
        }
        return false;
      }
      std::string_view ent = in.substr(i + 1, semi - (i + 1));
      if (ent == "lt")
        out.push_back('<');
      else if (ent == "gt")
        out.push_back('>');
      else if (ent == "amp")
        out.push_back('&');
      else if (ent == "apos")
        out.push_back('\'');
      else if (ent == "quot")
        out.push_back('"');
      else if (!ent.empty() && ent[0] == '#')
      {
        if (!appendCharRef(ent, out))
        {
          if (err)
          {
            *err = {i, 0, 0, "invalid character reference"};
          }
          return false;
        }
      }
      else
      {
        if (err)
        {
          *err = {i, 0, 0, "unknown entity"};
        }
        return false; // external entities unsupported by design
      }
      i = semi + 1;
    }
    return true;
  }

  /// \brief Escape text for use as character data or an attribute value.
  static std::string escape(std::string_view in, bool attribute = false)
  {
    std::string out;
    out.reserve(in.size());
    for (char ch : in)
    {
      switch (ch)
      {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        if (attribute)
          out += "&quot;";
        else
          out.push_back(ch);
        break;
      case '\'':
        if (attribute)
          out += "&apos;";
        else
          out.push_back(ch);
        break;
      default:
        out.push_back(ch);
        break;
      }
    }
    return out;
  }

private:
  enum class Step
  {
    Done,
    Incomplete,
    Failed
  };

  enum class Match
  {
    Yes,
    No,
    Partial
  };

  static bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  static bool isNameStart(char ch)
  {
    return (ch == ':' || ch == '_' || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
            static_cast<unsigned char>(ch) >= 0x80);
  }

  static bool isNameChar(char ch)
  {
    return isNameStart(ch) || (ch == '-' || ch == '.' || (ch >= '0' && ch <= '9'));
  }

  // Drop consumed bytes. Invalidates views held by the previous token.
  void compact()
  {
    if (_cur == 0)
    {
      return;
    }
    _buffer.erase(0, _cur);
    _base += _cur;
    _cur = 0;
  }

  // Move the cursor to p, maintaining line/column.
  void consumeTo(std::size_t p)
  {
    for (std::size_t i = _cur; i < p; ++i)
    {
      if (_buffer[i] == '\n')
      {
        ++_line;
        _col = 1;
      }
      else
      {
        ++_col;
      }
    }
    _cur = p;
  }

  Match matchAt(std::size_t p, std::string_view lit) const
  {
    for (std::size_t i = 0; i < lit.size(); ++i)
    {
      if (p + i >= _buffer.size())
      {
        return Match::Partial;
      }
      if (_buffer[p + i] != lit[i])
      {
        return Match::No;
      }
    }
    return Match::Yes;
  }

  // Reads a name at p. Returns Incomplete when the buffer ends inside the name,
  // since the next chunk may continue it.
  Step readName(std::size_t &p, std::string_view &out, const char *what)
  {
    std::size_t start = p;
    if (p >= _buffer.size())
    {
      return Step::Incomplete;
    }
    if (!isNameStart(_buffer[p]))
    {
      return failStep(p, std::string("invalid ") + what + " name");
    }
    ++p;
    while (p < _buffer.size() && isNameChar(_buffer[p]))
    {
      ++p;
    }
    if (p - start > _opt.maxNameLength)
    {
      return failStep(start, "name too long");
    }
    if (p >= _buffer.size())
    {
      return Step::Incomplete;
    }
    out = std::string_view(_buffer).substr(start, p - start);
    return Step::Done;
  }

  void skipSpaces(std::size_t &p) const
  {
    while (p < _buffer.size() && isSpace(_buffer[p]))
    {
      ++p;
    }
  }

  void beginToken(TokenKind kind, std::size_t start)
  {
    _token = Token{};
    _token.kind = kind;
    _token.offset = _base + start;
    _token.line = _line;
    _token.column = _col;
    _token.depth = _elementStack.size();
  }

  Step readMarkupDeclaration(std::size_t start)
  {
    std::size_t p = start + 2;
    Match comment = matchAt(p, "--");
    if (comment == Match::Yes)
    {
      return readDelimited(start, p + 2, "-->", TokenKind::Comment, "unterminated comment");
    }
    Match cdata = matchAt(p, "[CDATA[");
    if (cdata == Match::Yes)
    {
      if (_elementStack.empty())
      {
        return failStep(start, "CDATA section outside of root element");
      }
      return readDelimited(start, p + 7, "]]>", TokenKind::CData, "unterminated CDATA");
    }
    Match doctype = matchAt(p, "DOCTYPE");
    if (doctype == Match::Yes)
    {
      return readDoctype(start, p + 7);
    }
    if (comment == Match::Partial || cdata == Match::Partial || doctype == Match::Partial)
    {
      return Step::Incomplete;
    }
    return failStep(start, "unsupported markup declaration");
  }

  // Comment and CDATA bodies: everything up to the terminator.
  Step readDelimited(std::size_t start, std::size_t bodyStart, std::string_view terminator,
                     TokenKind kind, const char *unterminated)
  {
    std::size_t pos = _buffer.find(terminator.data(), bodyStart, terminator.size());
    if (pos == std::string::npos)
    {
      if (_buffer.size() - bodyStart > _opt.maxTextSpan)
      {
        return failStep(start, unterminated);
      }
      return Step::Incomplete;
    }
    beginToken(kind, start);
    _token.text = std::string_view(_buffer).substr(bodyStart, pos - bodyStart);
    consumeTo(pos + terminator.size());
    return Step::Done;
  }

  Step readDoctype(std::size_t start, std::size_t p)
  {
    if (!_elementStack.empty() || _seenRoot)
    {
      return failStep(start, "DOCTYPE must precede the root element");
    }
    int bracket = 0;
    std::size_t bodyStart = p;
    while (p < _buffer.size())
    {
      char ch = _buffer[p];
      if (ch == '[')
      {
        ++bracket;
      }
      else if (ch == ']')
      {
        if (bracket > 0)
        {
          --bracket;
        }
      }
      else if (ch == '>' && bracket == 0)
      {
        beginToken(TokenKind::Doctype, start);
        _token.text = std::string_view(_buffer).substr(bodyStart, p - bodyStart);
        consumeTo(p + 1);
        return Step::Done;
      }
      ++p;
    }
    if (p - bodyStart > _opt.maxTextSpan)
    {
      return failStep(start, "unterminated doctype");
    }
    return Step::Incomplete;
  }

  Step readProcessingInstruction(std::size_t start)
  {
    std::size_t p = start + 2;
    std::string_view target;
    Step s = readName(p, target, "processing instruction target");
    if (s != Step::Done)
    {
      return s;
    }
    std::size_t end = _buffer.find("?>", p);
    if (end == std::string::npos)
    {
      if (_buffer.size() - p > _opt.maxTextSpan)
      {
        return failStep(start, "unterminated processing instruction");
      }
      return Step::Incomplete;
    }
    std::size_t contentStart = p;
    skipSpaces(contentStart);
    if (contentStart > end)
    {
      contentStart = end;
    }
    if (target == "xml")
    {
      if (start != 0 || _base != 0)
      {
        return failStep(start, "XML declaration not at start of stream");
      }
      beginToken(TokenKind::XmlDecl, start);
    }
    else
    {
      beginToken(TokenKind::ProcessingInstruction, start);
    }
    _token.name = target;
    _token.text = std::string_view(_buffer).substr(contentStart, end - contentStart);
    consumeTo(end + 2);
    return Step::Done;
  }

  Step readEndTag(std::size_t start)
  {
    std::size_t p = start + 2;
    std::string_view name;
    Step s = readName(p, name, "end tag");
    if (s != Step::Done)
    {
      return s;
    }
    skipSpaces(p);
    if (p >= _buffer.size())
    {
      return Step::Incomplete;
    }
    if (_buffer[p] != '>')
    {
      return failStep(p, "expected '>' after end tag name");
    }

    if (_elementStack.empty())
    {
      return failStep(start, "end tag without matching start tag");
    }
    if (_elementStack.back() != name)
    {
      return failStep(start, "mismatched end tag - expected </" + _elementStack.back() +
                                 "> but got </" + std::string(name) + ">");
    }

    beginToken(TokenKind::EndElement, start);
    _token.name = name;
    _elementStack.pop_back();
    consumeTo(p + 1);
    return Step::Done;
  }

  Step readAttributes(std::size_t &p, std::vector<Attribute> &attrs)
  {
    attrs.clear();
    while (true)
    {
      std::size_t before = p;
      skipSpaces(p);
      if (p >= _buffer.size())
      {
        return Step::Incomplete;
      }
      char ch = _buffer[p];
      if (ch == '/' || ch == '>')
      {
        return Step::Done;
      }
      if (p == before)
      {
        return failStep(p, "expected whitespace before attribute");
      }
      std::string_view name;
      Step s = readName(p, name, "attribute");
      if (s != Step::Done)
      {
        return s;
      }
      skipSpaces(p);
      if (p >= _buffer.size())
      {
        return Step::Incomplete;
      }
      if (_buffer[p] != '=')
      {
        return failStep(p, "expected '=' after attribute name");
      }
      ++p;
      skipSpaces(p);
      if (p >= _buffer.size())
      {
        return Step::Incomplete;
      }
      char quote = _buffer[p];
      if (quote != '"' && quote != '\'')
      {
        return failStep(p, "expected '\"' or '\\'' for attribute value");
      }
      std::size_t valueStart = p + 1;
      std::size_t valueEnd = _buffer.find(quote, valueStart);
      if (valueEnd == std::string::npos)
      {
        if (_buffer.size() - valueStart > _opt.maxTextSpan)
        {
          return failStep(valueStart, "attribute value too long");
        }
        return Step::Incomplete;
      }
      std::string_view value = std::string_view(_buffer).substr(valueStart, valueEnd - valueStart);
      if (value.find('<') != std::string_view::npos)
      {
        return failStep(valueStart, "'<' not allowed in attribute value");
      }
      for (const auto &a : attrs)
      {
        if (a.name == name)
        {
          return failStep(p, "duplicate attribute '" + std::string(name) + "'");
        }
      }
      attrs.push_back(Attribute{name, value});
      if (attrs.size() > _opt.maxAttrsPerElement)
      {
        return failStep(p, "too many attributes");
      }
      p = valueEnd + 1;
    }
  }

  Step readStartOrEmptyTag(std::size_t start)
  {
    std::size_t p = start + 1;
    std::string_view name;
    Step s = readName(p, name, "start tag");
    if (s != Step::Done)
    {
      return s;
    }
    std::vector<Attribute> attrs;
    s = readAttributes(p, attrs);
    if (s != Step::Done)
    {
      return s;
    }

    bool empty = false;
    if (_buffer[p] == '/')
    {
      empty = true;
      ++p;
      if (p >= _buffer.size())
      {
        return Step::Incomplete;
      }
    }
    if (_buffer[p] != '>')
    {
      return failStep(p, "expected '>' to end start tag");
    }
    if (_elementStack.empty() && _seenRoot)
    {
      return failStep(start, "multiple root elements");
    }
    if (_elementStack.size() + 1 > _opt.maxDepth)
    {
      return failStep(start, "maximum element depth exceeded");
    }

    beginToken(empty ? TokenKind::EmptyElement : TokenKind::StartElement, start);
    _token.name = name;
    _token.attributes = std::move(attrs);
    _token.selfClosing = empty;
    _token.depth = _elementStack.size() + 1;
    if (!empty)
    {
      _elementStack.push_back(std::string(name));
    }
    _seenRoot = true;
    consumeTo(p + 1);
    return Step::Done;
  }

  // Character data runs to the next '<'. The run is only complete once that
  // '<' has arrived.
  Step readText(std::size_t start)
  {
    if (_elementStack.empty())
    {
      return failStep(start, "character data outside of root element");
    }
    const char *base = _buffer.data() + start;
    const void *lt = std::memchr(base, '<', _buffer.size() - start);
    if (lt == nullptr)
    {
      if (_buffer.size() - start > _opt.maxTextSpan)
      {
        return failStep(start, "text span too large");
      }
      return Step::Incomplete;
    }
    std::size_t end = start + static_cast<std::size_t>(static_cast<const char *>(lt) - base);
    if (end - start > _opt.maxTextSpan)
    {
      return failStep(start, "text span too large");
    }
    beginToken(TokenKind::Text, start);
    _token.text = std::string_view(_buffer).substr(start, end - start);
    consumeTo(end);
    return Step::Done;
  }

  Step failStep(std::size_t p, const std::string &msg)
  {
    fail(p, msg);
    return Step::Failed;
  }

  bool fail(std::size_t p, const std::string &msg)
  {
    consumeTo(std::min(std::max(p, _cur), _buffer.size()));
    _hasError = true;
    _error.offset = _base + _cur;
    _error.line = _line;
    _error.column = _col;
    _error.message = msg;
    return false;
  }

  // Append a numeric char ref (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  static bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = (entBody[1] == 'x' || entBody[1] == 'X');
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size())
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
      {
        v = static_cast<uint32_t>(c - '0');
      }
      else if (hex && c >= 'a' && c <= 'f')
      {
        v = static_cast<uint32_t>(c - 'a' + 10);
      }
      else if (hex && c >= 'A' && c <= 'F')
      {
        v = static_cast<uint32_t>(c - 'A' + 10);
      }
      else
      {
        return false;
      }
      code = hex ? ((code << 4) | v) : (code * 10u + v);
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    if (code == 0)
    {
      return false;
    }
    return encodeUtf8(code, out);
  }

  static bool encodeUtf8(uint32_t cp, std::string &out)
  {
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      // Exclude UTF-16 surrogate halves
      if (cp >= 0xD800u && cp <= 0xDFFFu)
      {
        return false;
      }
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0x10FFFFu)
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      return false;
    }
    return true;
  }

private:
  Options _opt{};

  std::string _buffer;   ///< Unconsumed input starts at _cur
  std::size_t _cur{0};
  std::size_t _base{0};  ///< Stream offset of _buffer[0]
  std::size_t _line{1};
  std::size_t _col{1};

  Token _token{};

  bool _hasError{false};
  Error _error{};
  bool _seenRoot{false};
  std::vector<std::string> _elementStack{}; // Track open element names for validation
};

/// \brief Child node kinds held by an Element.
enum class NodeType
{
  Element,
  Text
};

class Element;
using ElementPtr = std::shared_ptr<Element>;

/// \brief Child of an Element: either a nested element or a run of text.
struct ChildNode
{
  NodeType type{NodeType::Text};
  ElementPtr element; ///< Set when type == Element
  std::string text;   ///< Set when type == Text (entity-decoded)
};

/// \brief Mutable element tree node: qualified name, ordered attributes, ordered children.
class Element
{
public:
  struct Attr
  {
    std::string name;
    std::string value;
  };

  explicit Element(std::string qualifiedName) : _name(std::move(qualifiedName)) {}

  /// \brief Qualified name as written, e.g. "stream:features".
  const std::string &name() const { return _name; }

  std::string_view prefix() const
  {
    std::size_t pos = _name.find(':');
    return pos == std::string::npos ? std::string_view{} : std::string_view(_name).substr(0, pos);
  }

  std::string_view localName() const
  {
    std::size_t pos = _name.find(':');
    return pos == std::string::npos ? std::string_view(_name)
                                    : std::string_view(_name).substr(pos + 1);
  }

  const std::vector<Attr> &attributes() const { return _attributes; }

  bool hasAttribute(std::string_view attrName) const
  {
    return findAttribute(attrName) != nullptr;
  }

  /// \brief Find attribute by name; returns empty string_view if not found.
  std::string_view attribute(std::string_view attrName) const
  {
    const Attr *a = findAttribute(attrName);
    return a ? std::string_view(a->value) : std::string_view{};
  }

  /// \brief Set or replace an attribute, keeping its original position.
  void setAttribute(std::string attrName, std::string value)
  {
    for (auto &a : _attributes)
    {
      if (a.name == attrName)
      {
        a.value = std::move(value);
        return;
      }
    }
    _attributes.push_back(Attr{std::move(attrName), std::move(value)});
  }

  const std::vector<ChildNode> &children() const { return _children; }

  void appendChild(ElementPtr child)
  {
    ChildNode n;
    n.type = NodeType::Element;
    n.element = std::move(child);
    _children.push_back(std::move(n));
  }

  /// \brief Create a child element, append it and return it.
  ElementPtr addElement(std::string qualifiedName)
  {
    auto child = std::make_shared<Element>(std::move(qualifiedName));
    appendChild(child);
    return child;
  }

  /// \brief Append text; adjacent text runs are merged.
  void addText(std::string_view text)
  {
    if (text.empty())
    {
      return;
    }
    if (!_children.empty() && _children.back().type == NodeType::Text)
    {
      _children.back().text.append(text.data(), text.size());
      return;
    }
    ChildNode n;
    n.type = NodeType::Text;
    n.text = std::string(text);
    _children.push_back(std::move(n));
  }

  /// \brief Find first direct child element by qualified name; nullptr if none.
  ElementPtr firstChildElement(std::string_view qualifiedName) const
  {
    for (const auto &c : _children)
    {
      if (c.type == NodeType::Element && c.element->name() == qualifiedName)
      {
        return c.element;
      }
    }
    return nullptr;
  }

  std::vector<ElementPtr> childElements() const
  {
    std::vector<ElementPtr> out;
    for (const auto &c : _children)
    {
      if (c.type == NodeType::Element)
      {
        out.push_back(c.element);
      }
    }
    return out;
  }

  /// \brief Text of all direct text children concatenated.
  std::string textContent() const
  {
    std::string result;
    for (const auto &c : _children)
    {
      if (c.type == NodeType::Text)
      {
        result += c.text;
      }
    }
    return result;
  }

  /// \brief Start tag only, e.g. "<stream:stream to='x'>", for opening a stream.
  std::string openTag() const
  {
    std::string out;
    writeStartTag(out);
    out.push_back('>');
    return out;
  }

  /// \brief Serialize this element and its subtree.
  std::string toXml() const
  {
    std::string out;
    serialize(out);
    return out;
  }

private:
  const Attr *findAttribute(std::string_view attrName) const
  {
    for (const auto &a : _attributes)
    {
      if (a.name == attrName)
      {
        return &a;
      }
    }
    return nullptr;
  }

  void writeStartTag(std::string &out) const
  {
    out.push_back('<');
    out += _name;
    for (const auto &a : _attributes)
    {
      out.push_back(' ');
      out += a.name;
      out += "='";
      out += StreamTokenizer::escape(a.value, true);
      out.push_back('\'');
    }
  }

  void serialize(std::string &out) const
  {
    writeStartTag(out);
    if (_children.empty())
    {
      out += "/>";
      return;
    }
    out.push_back('>');
    for (const auto &c : _children)
    {
      if (c.type == NodeType::Element)
      {
        c.element->serialize(out);
      }
      else
      {
        out += StreamTokenizer::escape(c.text);
      }
    }
    out += "</";
    out += _name;
    out.push_back('>');
  }

  std::string _name;
  std::vector<Attr> _attributes;
  std::vector<ChildNode> _children;
};

/// \brief Build an Element from a StartElement/EmptyElement token, decoding attribute values.
inline ElementPtr makeElement(const Token &t, Error *err = nullptr)
{
  auto elem = std::make_shared<Element>(std::string(t.name));
  for (const auto &a : t.attributes)
  {
    std::string v;
    if (!StreamTokenizer::decodeEntities(a.value, v, err))
    {
      return nullptr;
    }
    elem->setAttribute(std::string(a.name), std::move(v));
  }
  return elem;
}

} // namespace xml
} // namespace parsers
} // namespace xstream
