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


#include "remote/pairing.hpp"
#include "base/logger.hpp"
#include "remote/wire.hpp"

namespace firemote {
namespace remote {

Pairing::Pairing(Session &session) noexcept
    : session(session), current(session.paired() ? State::Paired : State::Unpaired) {}

bool Pairing::request_pin(csv friendly_name) {
  INFO_AUTO_CAT("request_pin");

  const auto reply = session.request(Method::Post, wire::path_pin_display, false,
                                     Fields{{string(wire::key_friendly_name), string(friendly_name)}});

  const auto displayed = json::description(reply) == wire::ack;

  if (displayed) current = State::PinRequested;

  INFO_AUTO("name={} displayed={} state={}", friendly_name, displayed, current);

  return displayed;
}

bool Pairing::verify_pin(csv pin) {
  INFO_AUTO_CAT("verify_pin");

  const auto reply = session.request(Method::Post, wire::path_pin_verify, false,
                                     Fields{{string(wire::key_pin), string(pin)}});

  // the token arrives in the description field
  auto token = json::description(reply);

  if (token.empty()) {
    INFO_AUTO("rejected, state={}", current);
    return false;
  }

  session.assign_token(std::move(token));
  current = State::Paired;

  INFO_AUTO("accepted, state={}", current);

  return true;
}

} // namespace remote
} // namespace firemote
