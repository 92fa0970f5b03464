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
#include "remote/device.hpp"

#include <functional>

namespace firemote {
namespace mdns {

/// @brief Invoked once per newly discovered device, on the thread calling discover()
using OnFound = std::function<void(const remote::Device &)>;

/// @brief Source of devices on the local network
class Provider {
public:
  virtual ~Provider() = default;

  /// @brief Browse for devices until the timeout elapses
  /// @param timeout discovery window
  /// @param on_found optional notification per distinct device
  /// @return every device found (possibly empty)
  virtual remote::Devices discover(Millis timeout, const OnFound &on_found = nullptr) = 0;
};

} // namespace mdns
} // namespace firemote
