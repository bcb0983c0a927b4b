// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "common/i_event_dispatcher.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "network/transport.hpp"
#include "parsers/minimal_toml.hpp"
#include "parsers/xml.hpp"
#include "protocol/bootstrap.hpp"
#include "protocol/factory.hpp"
#include "protocol/protocol.hpp"
#include "util/event_dispatcher.hpp"
#include "xml/incremental_parser.hpp"
#include "xml/xml_stream.hpp"
#include "xml/xml_stream_factory.hpp"

#define XSTREAM_DEFAULT_CONFIG_FILE_PATH "/etc/xstream/xstream.toml"
