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
#include "remote/session.hpp"

#include <fmt/format.h>

namespace firemote {
namespace remote {

/// @brief PIN handshake that turns an unauthenticated session into a paired one
///
///   Unpaired --request_pin--> PinRequested --verify_pin--> Paired
///
/// A rejected PIN leaves the state (and the session token) untouched so
/// verify_pin may be retried. There is no client side expiry of a PIN.
class Pairing {
public:
  enum class State : uint8_t { Unpaired = 0, PinRequested, Paired };

public:
  explicit Pairing(Session &session) noexcept;

  /// @brief Ask the device to display a PIN
  /// @param friendly_name name shown on the device for this client
  /// @return true when the device acknowledged the request
  /// @throws TransportError, ProtocolError
  bool request_pin(csv friendly_name);

  /// @brief Verify the PIN displayed by the device, on success the token
  ///        returned by the device is assigned to the session
  /// @param pin as entered by the user (not validated locally)
  /// @return true when the device accepted the PIN
  /// @throws TransportError, ProtocolError
  bool verify_pin(csv pin);

  State state() const noexcept { return current; }

private:
  Session &session;
  State current;

public:
  MOD_ID("remote.pairing");
};

} // namespace remote
} // namespace firemote

template <> struct fmt::formatter<firemote::remote::Pairing::State> : fmt::formatter<std::string_view> {

  template <typename FormatContext>
  auto format(firemote::remote::Pairing::State st, FormatContext &ctx) const {
    using State = firemote::remote::Pairing::State;

    std::string_view name{"unpaired"};
    if (st == State::PinRequested) name = "pin_requested";
    if (st == State::Paired) name = "paired";

    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
