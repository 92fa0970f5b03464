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


#include "base/resp_code.hpp"

#include <map>

namespace firemote {

typedef const std::map<unsigned, const char *> RespCodeMap;

static RespCodeMap _resp_code_ccs{{RespCode::OK, "OK"},
                                  {RespCode::Created, "Created"},
                                  {RespCode::Accepted, "Accepted"},
                                  {RespCode::NoContent, "No Content"},
                                  {RespCode::BadRequest, "Bad Request"},
                                  {RespCode::Unauthorized, "Unauthorized"},
                                  {RespCode::Forbidden, "Forbidden"},
                                  {RespCode::NotFound, "Not Found"},
                                  {RespCode::Timeout, "Request Timeout"},
                                  {RespCode::InternalServerError, "Internal Server Error"},
                                  {RespCode::NotImplemented, "Not Implemented"},
                                  {RespCode::Unavailable, "Service Unavailable"}};

csv respCodeToView(unsigned resp_code) noexcept {
  if (auto it = _resp_code_ccs.find(resp_code); it != _resp_code_ccs.end()) {
    return csv(it->second);
  }

  return csv{"Unknown"};
}

} // namespace firemote
