// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace xstream
{
namespace common
{

/// Observer registration/dispatch capability
///
/// Anything that can have observers installed on it (an EventDispatcher, a
/// protocol built on one) implements this interface. BootstrapMixin and the
/// protocol factories only talk to targets through it.
///
/// Observers are held by shared pointer. The pointer is the observer's
/// identity: removeObserver() removes the registration whose pointer compares
/// equal, so keep the handle returned by makeObserver() if you intend to
/// remove it later.
template <typename Payload> class IEventDispatcher
{
public:
  using Callback = std::function<void(const Payload &)>;
  using Observer = std::shared_ptr<const Callback>;

  virtual ~IEventDispatcher() = default;

  /// Register \p observer for \p selector. Higher \p priority runs first;
  /// equal priorities run in registration order. No deduplication.
  virtual void addObserver(const std::string &selector, Observer observer, int priority = 0) = 0;

  /// Remove the first registration of \p observer under \p selector.
  /// Removing something that is not registered does nothing.
  virtual void removeObserver(const std::string &selector, const Observer &observer) = 0;

  /// Invoke every observer registered for \p selector with \p payload.
  ///
  /// @return true if at least one observer ran
  /// @throws whatever an observer throws; later observers of the pass do not run
  virtual bool dispatch(const Payload &payload, const std::string &selector) = 0;
};

/// Wrap a callable into an observer handle
template <typename Payload, typename Fn>
typename IEventDispatcher<Payload>::Observer makeObserver(Fn &&fn)
{
  return std::make_shared<const typename IEventDispatcher<Payload>::Callback>(
    std::forward<Fn>(fn));
}

} // namespace common
} // namespace xstream
