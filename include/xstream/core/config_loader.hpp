// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "xstream/core/logger.hpp"
#include "xstream/parsers/minimal_toml.hpp"
#include "xstream/parsers/xml.hpp"

namespace xstream
{
namespace core
{
/// \brief Loads a TOML configuration file and maps it onto library settings.
///
/// Recognised keys:
/// \code
/// [parser]
/// max_depth = 256
/// max_attributes = 256
/// max_name_length = 1024
/// max_text_span = 1048576
/// max_buffered_bytes = 4194304
///
/// [log]
/// level = "info"
/// file = ""
/// format = "[%T] [%L] %m"
/// \endcode
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// table is kept and lastError() describes the problem.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parseFile(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::runtime_error &e)
    {
      _lastError = e.what();
      XSTREAM_LOG_ERROR("ConfigLoader: failed to load " << _filename << ": " << e.what());
      return false;
    }
  }

  const parsers::toml::Table &load()
  {
    if (_table.empty())
    {
      if (!reload())
      {
        throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                                 _lastError + ")");
      }
    }
    return _table;
  }

  const parsers::toml::Table &table() const { return _table; }

  const std::string &lastError() const { return _lastError; }

  /// \brief Gets a typed value from the configuration.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    parsers::toml::Value v = _table.atPath(dottedKey);
    if (!v.isValue())
    {
      return std::nullopt;
    }
    return v.as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \throws std::runtime_error if the key is an array but any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    parsers::toml::Value v = _table.atPath(key);
    const parsers::toml::Array *arr = v.asArray();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      auto s = elem.as<std::string>();
      if (!s)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*s);
    }
    return result;
  }

  /// \brief Parser limits from [parser]; missing keys keep their defaults.
  /// \throws std::runtime_error for zero or negative limits.
  parsers::xml::Options parserOptions() const
  {
    parsers::xml::Options opt;
    readLimit("parser.max_depth", opt.maxDepth);
    readLimit("parser.max_attributes", opt.maxAttrsPerElement);
    readLimit("parser.max_name_length", opt.maxNameLength);
    readLimit("parser.max_text_span", opt.maxTextSpan);
    readLimit("parser.max_buffered_bytes", opt.maxBufferedBytes);
    return opt;
  }

  Logger::Level logLevel(Logger::Level fallback = Logger::Level::Info) const
  {
    auto name = getString("log.level");
    return name ? Logger::levelFromString(*name, fallback) : fallback;
  }

  /// \brief Apply the [log] section to the process-wide Logger.
  void configureLogger() const
  {
    Logger::init(logLevel(), getString("log.file").value_or(""));
    if (auto format = getString("log.format"))
    {
      Logger::setLogFormat(*format);
    }
  }

private:
  void readLimit(const std::string &key, std::size_t &out) const
  {
    auto v = getInt(key);
    if (!v)
    {
      return;
    }
    if (*v <= 0)
    {
      throw std::runtime_error("ConfigLoader: '" + key + "' must be positive");
    }
    out = static_cast<std::size_t>(*v);
  }

  std::string _filename;
  std::string _lastError;
  parsers::toml::Table _table;
};

} // namespace core
} // namespace xstream
