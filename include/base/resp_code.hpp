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

namespace firemote {

/// @brief HTTP status codes used by the device API and DIAL endpoint
enum RespCode : uint16_t {
  OK = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  Timeout = 408,
  InternalServerError = 500,
  NotImplemented = 501,
  Unavailable = 503
};

/// @brief Is the status code in the 2xx class?
/// @param code raw status code
/// @return boolean
constexpr bool resp_code_ok(unsigned code) noexcept { return (code >= 200) && (code < 300); }

csv respCodeToView(unsigned resp_code) noexcept;

} // namespace firemote
