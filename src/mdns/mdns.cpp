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


#include "mdns/mdns.hpp"
#include "base/conf/keys.hpp"
#include "base/elapsed.hpp"
#include "base/logger.hpp"
#include "mdns/found.hpp"
#include "mdns/mdns_ctx.hpp"

#include <fmt/chrono.h>

namespace firemote {

mDNS::mDNS() noexcept
    : conf::token(conf::root::mdns),               //
      stype(val<string>("service"sv, def_stype)) //
{}

remote::Devices mDNS::discover(Millis timeout, const mdns::OnFound &on_found) {
  INFO_AUTO_CAT("discover");

  Elapsed e;
  mdns::Found found;

  {
    mdns::Ctx ctx(stype, found);

    if (ctx.error().empty()) {
      found.deliver_until(mdns::Found::clock::now() + timeout, on_found);
    } else {
      INFO_AUTO("unavailable, {}", ctx.error());
    }
  } // avahi resources released here

  // resolved after the deadline but before the context stopped
  found.deliver_pending(on_found);

  if (found.failed()) INFO_AUTO("stopped early, {}", found.reason());

  auto devices = found.devices();

  INFO_AUTO("found {} device(s) type={} elapsed={}", devices.size(), stype,
            e.as<Millis>());

  return devices;
}

} // namespace firemote
