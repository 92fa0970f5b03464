//  firemote - Fire TV remote control client
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com


#pragma once

#include "base/types.hpp"
#include "mdns/provider.hpp"
#include "mdns/zservice.hpp"
#include "remote/device.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace firemote {
namespace mdns {

/// @brief Collects resolved announcements (from the Avahi poll thread) and
///        hands new devices to the thread waiting in discover()
class Found {
public:
  using clock = std::chrono::steady_clock;

public:
  Found() = default;

  /// @brief Record a resolved service, duplicates (by advertised name) are ignored
  /// @return true when the service is new
  bool add(const ZeroConf &zc) noexcept;

  /// @brief Discovery can not continue (e.g. the mDNS daemon went away)
  void fail(string reason) noexcept;

  /// @brief Deliver new devices to on_found until the deadline or a failure
  void deliver_until(clock::time_point deadline, const OnFound &on_found);

  /// @brief Deliver devices added but not yet delivered
  void deliver_pending(const OnFound &on_found);

  remote::Devices devices() const noexcept;
  bool failed() const noexcept;
  string reason() const noexcept;

private:
  // order independent
  mutable std::mutex mtx;
  std::condition_variable cv;
  remote::Devices all;
  std::deque<remote::Device> pending;
  string fail_reason;

public:
  MOD_ID("mdns.found");
};

} // namespace mdns
} // namespace firemote
