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


#include "mdns/zservice.hpp"

#include <fmt/format.h>
#include <iterator>

namespace firemote {

ZeroConf::ZeroConf(Details d) noexcept
    : _hostname(d.hostname ? d.hostname : ""), // service host name
      name_net(d.name_net),                    // advertised instance name
      _address(d.address),                     // resolved address
      _type(d.type),                           // service type
      _port(d.port),                           // service port
      _protocol(d.protocol),                   // address family (IPv4 or IPv6)
      _name_short(strip_type(name_net, _type)) //
{}

string ZeroConf::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "{} {} '{}' {} {}:{}", _type, _hostname, _name_short, _protocol, _address,
                 _port);

  return msg;
}

string ZeroConf::strip_type(csv name, csv type) noexcept {
  string short_name(name);

  if (type.empty()) return short_name;

  const auto suffix = fmt::format(".{}", type);

  if (auto pos = short_name.find(suffix); pos != string::npos) short_name.erase(pos);

  return short_name;
}

} // namespace firemote
