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

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace firemote {

namespace asio = boost::asio;
namespace errc = boost::system::errc;

using error_code = boost::system::error_code;

} // namespace firemote
