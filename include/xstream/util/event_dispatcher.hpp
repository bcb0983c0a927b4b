// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xstream, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "xstream/common/i_event_dispatcher.hpp"
#include "xstream/core/logger.hpp"

namespace xstream
{
namespace util
{

/// \brief Synchronous observer registry keyed by exact selector strings.
///
/// dispatch() copies the selector's observer list before invoking anything,
/// so observers may add or remove registrations (including their own) while
/// being dispatched; such changes take effect from the next dispatch.
/// Not thread-safe: one dispatcher belongs to one connection.
template <typename Payload> class EventDispatcher : public common::IEventDispatcher<Payload>
{
public:
  using Base = common::IEventDispatcher<Payload>;
  using Callback = typename Base::Callback;
  using Observer = typename Base::Observer;

  EventDispatcher() = default;
  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;
  ~EventDispatcher() override = default;

  void addObserver(const std::string &selector, Observer observer,
                   int priority = 0) override
  {
    if (!observer)
    {
      return;
    }
    insert(selector, Registration{std::move(observer), priority, false});
  }

  /// \brief Register a plain callback; returns the handle for removal.
  Observer addObserver(const std::string &selector, Callback callback,
                       int priority = 0)
  {
    Observer observer = std::make_shared<const Callback>(std::move(callback));
    addObserver(selector, observer, priority);
    return observer;
  }

  /// \brief Register a callback that is removed after it has run once.
  Observer addOnetimeObserver(const std::string &selector, Callback callback,
                              int priority = 0)
  {
    Observer observer = std::make_shared<const Callback>(std::move(callback));
    insert(selector, Registration{observer, priority, true});
    return observer;
  }

  void removeObserver(const std::string &selector, const Observer &observer) override
  {
    auto it = _observers.find(selector);
    if (it == _observers.end())
    {
      return;
    }
    auto &list = it->second;
    auto match = std::find_if(list.begin(), list.end(),
                              [&observer](const Registration &r)
                              { return r.observer == observer; });
    if (match == list.end())
    {
      return;
    }
    list.erase(match);
    if (list.empty())
    {
      _observers.erase(it);
    }
  }

  bool dispatch(const Payload &payload, const std::string &selector) override
  {
    auto it = _observers.find(selector);
    if (it == _observers.end())
    {
      return false;
    }

    // Snapshot; observers may mutate the registry while we iterate
    std::vector<Registration> snapshot = it->second;

    for (const auto &reg : snapshot)
    {
      if (reg.onetime)
      {
        removeRegistration(selector, reg);
      }
    }

    for (const auto &reg : snapshot)
    {
      (*reg.observer)(payload);
    }
    return !snapshot.empty();
  }

  bool hasObservers(const std::string &selector) const
  {
    return _observers.find(selector) != _observers.end();
  }

  std::size_t observerCount(const std::string &selector) const
  {
    auto it = _observers.find(selector);
    return it == _observers.end() ? 0 : it->second.size();
  }

  void clearObservers() { _observers.clear(); }

private:
  struct Registration
  {
    Observer observer;
    int priority;
    bool onetime;
  };

  void insert(const std::string &selector, Registration reg)
  {
    auto &list = _observers[selector];
    // After the last registration with priority >= reg.priority
    auto pos = std::find_if(list.begin(), list.end(),
                            [&reg](const Registration &r)
                            { return r.priority < reg.priority; });
    list.insert(pos, std::move(reg));
    XSTREAM_LOG_TRACE("EventDispatcher: registered observer for '"
                      << selector << "' (total: " << list.size() << ")");
  }

  void removeRegistration(const std::string &selector, const Registration &reg)
  {
    auto it = _observers.find(selector);
    if (it == _observers.end())
    {
      return;
    }
    auto &list = it->second;
    auto match = std::find_if(list.begin(), list.end(),
                              [&reg](const Registration &r)
                              { return r.observer == reg.observer && r.onetime; });
    if (match != list.end())
    {
      list.erase(match);
    }
    if (list.empty())
    {
      _observers.erase(it);
    }
  }

  std::map<std::string, std::vector<Registration>> _observers;
};

} // namespace util
} // namespace xstream
