// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Small TOML subset reader used for xstream configuration files.
///
/// Supported: [section] and [dotted.section] headers, bare and dotted keys,
/// basic and literal strings, integers, floats, booleans, single-line arrays,
/// and '#' comments. Inline tables, multi-line strings and dates are not.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace xstream
{
namespace parsers
{
namespace toml
{

class Table;
class Value;

using Array = std::vector<Value>;

/// \brief Raised for malformed input; carries the 1-based line number.
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string &message, std::size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + message), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

/// \brief A TOML value. Tables and arrays are held by shared pointer so that
/// values stay cheap to copy.
class Value
{
public:
  using Storage = std::variant<std::monostate, int64_t, double, bool, std::string,
                               std::shared_ptr<Array>, std::shared_ptr<Table>>;

  Value() = default;
  Value(Storage storage) : _storage(std::move(storage)) {}

  bool isValue() const
  {
    return !std::holds_alternative<std::monostate>(_storage) && !isTable() && !isArray();
  }
  bool isString() const { return std::holds_alternative<std::string>(_storage); }
  bool isInteger() const { return std::holds_alternative<int64_t>(_storage); }
  bool isFloat() const { return std::holds_alternative<double>(_storage); }
  bool isBool() const { return std::holds_alternative<bool>(_storage); }
  bool isArray() const { return std::holds_alternative<std::shared_ptr<Array>>(_storage); }
  bool isTable() const { return std::holds_alternative<std::shared_ptr<Table>>(_storage); }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_storage); }

  /// \brief Typed access; integers widen to double on request.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_storage))
        return *d;
      if (auto *i = std::get_if<int64_t>(&_storage))
        return static_cast<double>(*i);
      return std::nullopt;
    }
    else
    {
      if (auto *v = std::get_if<T>(&_storage))
        return *v;
      return std::nullopt;
    }
  }

  const Array *asArray() const
  {
    auto *p = std::get_if<std::shared_ptr<Array>>(&_storage);
    return p ? p->get() : nullptr;
  }

  Table *asTable()
  {
    auto *p = std::get_if<std::shared_ptr<Table>>(&_storage);
    return p ? p->get() : nullptr;
  }

  const Table *asTable() const
  {
    auto *p = std::get_if<std::shared_ptr<Table>>(&_storage);
    return p ? p->get() : nullptr;
  }

private:
  Storage _storage;
};

/// \brief Ordered key/value table.
class Table
{
public:
  bool contains(const std::string &key) const { return _entries.count(key) != 0; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }

  Value &operator[](const std::string &key) { return _entries[key]; }

  /// \brief Look up "a.b.c"; returns an empty Value when any part is missing.
  Value atPath(const std::string &dottedPath) const
  {
    const Table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? std::string::npos
                                                                           : dot - start);
      auto it = current->_entries.find(part);
      if (it == current->_entries.end())
      {
        return Value{};
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.asTable();
      start = dot + 1;
    }
    return Value{};
  }

  std::map<std::string, Value>::const_iterator begin() const { return _entries.begin(); }
  std::map<std::string, Value>::const_iterator end() const { return _entries.end(); }

private:
  std::map<std::string, Value> _entries;
};

/// \brief Single-pass reader over a TOML document.
class Reader
{
public:
  explicit Reader(std::string input) : _input(std::move(input)) {}

  Table parse()
  {
    Table root;
    Table *current = &root;
    while (true)
    {
      skipBlankAndComments();
      if (atEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        advance();
        std::vector<std::string> path = readKeyPath();
        skipInlineSpace();
        if (peek() != ']')
        {
          throw ParseError("expected ']' to close table header", _line);
        }
        advance();
        current = descend(root, path);
      }
      else
      {
        std::vector<std::string> path = readKeyPath();
        skipInlineSpace();
        if (peek() != '=')
        {
          throw ParseError("expected '=' after key", _line);
        }
        advance();
        skipInlineSpace();
        Value value = readValue();
        std::string leaf = path.back();
        path.pop_back();
        Table *target = descend(*current, path);
        if (target->contains(leaf))
        {
          throw ParseError("duplicate key '" + leaf + "'", _line);
        }
        (*target)[leaf] = std::move(value);
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void skipInlineSpace()
  {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
    {
      advance();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!atEnd() && peek() != '\n')
      {
        advance();
      }
    }
  }

  void skipBlankAndComments()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  void expectLineEnd()
  {
    skipInlineSpace();
    skipComment();
    if (peek() == '\r')
    {
      advance();
    }
    if (!atEnd() && peek() != '\n')
    {
      throw ParseError("unexpected trailing characters", _line);
    }
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> readKeyPath()
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipInlineSpace();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = readString();
      }
      else
      {
        while (!atEnd() && isBareKeyChar(peek()))
        {
          part.push_back(advance());
        }
        if (part.empty())
        {
          throw ParseError("expected key", _line);
        }
      }
      parts.push_back(std::move(part));
      skipInlineSpace();
      if (peek() != '.')
      {
        return parts;
      }
      advance();
    }
  }

  Table *descend(Table &from, const std::vector<std::string> &path)
  {
    Table *current = &from;
    for (const auto &key : path)
    {
      Value &slot = (*current)[key];
      if (!slot)
      {
        slot = Value(std::make_shared<Table>());
      }
      current = slot.asTable();
      if (!current)
      {
        throw ParseError("key '" + key + "' is not a table", _line);
      }
    }
    return current;
  }

  Value readValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return Value(readString());
    }
    if (c == '[')
    {
      return readArray();
    }
    if (c == 't' || c == 'f')
    {
      return Value(readBool());
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return readNumber();
    }
    throw ParseError("invalid value", _line);
  }

  std::string readString()
  {
    char quote = advance();
    std::string out;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && quote == '"' && !atEnd())
      {
        char esc = advance();
        switch (esc)
        {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case '"':
        case '\\':
          out.push_back(esc);
          break;
        default:
          throw ParseError(std::string("unsupported escape '\\") + esc + "'", _line);
        }
        continue;
      }
      out.push_back(c);
    }
    if (peek() != quote)
    {
      throw ParseError("unterminated string", _line);
    }
    advance();
    return out;
  }

  Value readArray()
  {
    advance();
    auto arr = std::make_shared<Array>();
    while (true)
    {
      skipBlankAndComments();
      if (peek() == ']')
      {
        advance();
        return Value(arr);
      }
      arr->push_back(readValue());
      skipBlankAndComments();
      if (peek() == ',')
      {
        advance();
      }
      else if (peek() != ']')
      {
        throw ParseError("expected ',' or ']' in array", _line);
      }
    }
  }

  bool readBool()
  {
    std::string word;
    while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek())))
    {
      word.push_back(advance());
    }
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    throw ParseError("invalid boolean '" + word + "'", _line);
  }

  Value readNumber()
  {
    std::string text;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-')
      {
        text.push_back(advance());
      }
      else if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
        text.push_back(advance());
      }
      else if (c == '_')
      {
        advance();
      }
      else
      {
        break;
      }
    }
    try
    {
      std::size_t used = 0;
      Value v = isFloat ? Value(std::stod(text, &used))
                        : Value(static_cast<int64_t>(std::stoll(text, &used)));
      if (used != text.size())
      {
        throw ParseError("invalid number '" + text + "'", _line);
      }
      return v;
    }
    catch (const std::logic_error &)
    {
      throw ParseError("invalid number '" + text + "'", _line);
    }
  }
};

inline Table parse(const std::string &document) { return Reader(document).parse(); }

inline Table parseFile(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace xstream
