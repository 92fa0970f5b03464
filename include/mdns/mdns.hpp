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

#include "base/conf/token.hpp"
#include "base/types.hpp"
#include "mdns/provider.hpp"
#include "remote/device.hpp"

namespace firemote {

/// @brief Device discovery over mDNS / DNS-SD (Avahi)
class mDNS : public mdns::Provider, public conf::token {

public:
  static constexpr csv def_stype{"_amzn-fireTv._tcp"};

public:
  mDNS() noexcept;

  /// @brief Discovery window from the mdns configuration table
  Millis timeout() const noexcept { return timeout_val(""sv, Seconds(5)); }

  remote::Devices discover(Millis timeout, const mdns::OnFound &on_found = nullptr) override;

public:
  // order dependent
  const string stype;

public:
  MOD_ID("mdns");
};

} // namespace firemote
