// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "xstream/common/i_event_dispatcher.hpp"

namespace xstream
{
namespace protocol
{

/// \brief Ordered list of (selector, observer) pairs to install on every
/// dispatcher a factory produces.
template <typename Payload> class BootstrapMixin
{
public:
  using Dispatcher = common::IEventDispatcher<Payload>;
  using Callback = typename Dispatcher::Callback;
  using Observer = typename Dispatcher::Observer;
  using Bootstrap = std::pair<std::string, Observer>;

  virtual ~BootstrapMixin() = default;

  void addBootstrap(const std::string &selector, Observer observer)
  {
    _bootstraps.emplace_back(selector, std::move(observer));
  }

  /// \brief Wrap \p callback and append it; returns the handle for removeBootstrap().
  Observer addBootstrap(const std::string &selector, Callback callback)
  {
    Observer observer = std::make_shared<const Callback>(std::move(callback));
    addBootstrap(selector, observer);
    return observer;
  }

  /// \brief Remove the first matching pair. Does nothing if there is none.
  void removeBootstrap(const std::string &selector, const Observer &observer)
  {
    auto it = std::find_if(_bootstraps.begin(), _bootstraps.end(), [&](const Bootstrap &b)
                           { return b.first == selector && b.second == observer; });
    if (it != _bootstraps.end())
    {
      _bootstraps.erase(it);
    }
  }

  /// \brief Register every bootstrap on \p dispatcher, in list order. The
  /// list is left as is, so this may be applied to any number of targets.
  void installBootstraps(Dispatcher &dispatcher) const
  {
    for (const auto &b : _bootstraps)
    {
      dispatcher.addObserver(b.first, b.second);
    }
  }

  const std::vector<Bootstrap> &bootstraps() const { return _bootstraps; }

private:
  std::vector<Bootstrap> _bootstraps;
};

} // namespace protocol
} // namespace xstream
