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
#include "remote/transport.hpp"

namespace firemote {
namespace remote {

/// @brief Transport over Boost.Beast (plain TCP or TLS via OpenSSL)
///        each exchange uses a private io_context and a fresh connection
class HttpTransport : public Transport {
public:
  HttpTransport() = default;

  Reply exchange(const Endpoint &ep, const Request &req) override;

public:
  MOD_ID("remote.http");
};

} // namespace remote
} // namespace firemote
