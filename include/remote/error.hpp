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

#include <stdexcept>

namespace firemote {
namespace remote {

/// @brief Base of every error raised by the remote control core
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief Non-2xx reply or a connection, TLS or timeout failure
class TransportError : public Error {
public:
  /// @param status HTTP status, 0 when no reply was received
  /// @param body reply body (or the empty string)
  /// @param what human readable description
  TransportError(unsigned status, string body, const string &what)
      : Error(what), status_code(status), reply_body(std::move(body)) {}

  unsigned status() const noexcept { return status_code; }
  const string &body() const noexcept { return reply_body; }

private:
  unsigned status_code;
  string reply_body;
};

/// @brief Reply body is not the JSON shape the operation expects
class ProtocolError : public Error {
public:
  using Error::Error;
};

/// @brief Operation needs a client token and the session has none
class AuthenticationRequired : public Error {
public:
  AuthenticationRequired() : Error("not paired, client token required") {}
};

} // namespace remote
} // namespace firemote
