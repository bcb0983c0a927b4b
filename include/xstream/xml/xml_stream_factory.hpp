// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "xstream/protocol/factory.hpp"
#include "xstream/xml/xml_stream.hpp"

namespace xstream
{
namespace xml
{

/// \brief Factory for plain XmlStream protocols sharing one set of parser limits.
class XmlStreamFactory : public protocol::XmlStreamFactoryMixin<XmlStream, ParserOptions>
{
public:
  explicit XmlStreamFactory(const ParserOptions &options = ParserOptions{})
      : protocol::XmlStreamFactoryMixin<XmlStream, ParserOptions>(options)
  {
  }

  const ParserOptions &options() const { return std::get<0>(arguments()); }
};

} // namespace xml
} // namespace xstream
