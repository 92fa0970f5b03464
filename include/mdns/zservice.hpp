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

namespace firemote {

/// @brief A resolved service announcement
class ZeroConf {
public:
  struct Details {
    ccs hostname;
    ccs name_net;
    ccs address;
    ccs type;
    uint16_t port;
    ccs protocol;
  };

public:
  ZeroConf(Details d) noexcept;

  const string &address() const noexcept { return _address; }
  const string &hostname() const noexcept { return _hostname; }

  /// @brief Advertised instance name
  const string &name() const noexcept { return name_net; }

  /// @brief Instance name without the service type suffix some responders include
  ///        (e.g. "Living Room._amzn-fireTv._tcp.local." becomes "Living Room")
  const string &name_short() const noexcept { return _name_short; }

  uint16_t port() const noexcept { return _port; }
  const string &protocol() const noexcept { return _protocol; }
  const string &type() const noexcept { return _type; }

  /// @brief Device reachable at the resolved address on the remote control port
  remote::Device device() const noexcept {
    return remote::Device{.name = _name_short, .host = _address, .port = remote::API_PORT};
  }

  // misc debug
  string inspect() const noexcept;

  static string strip_type(csv name, csv type) noexcept;

private:
  // order dependent
  string _hostname;
  string name_net;
  string _address;
  string _type;
  uint16_t _port;
  string _protocol;

  // order independent
  string _name_short;

public:
  MOD_ID("zservice");
};

} // namespace firemote
