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

#include <fmt/format.h>
#include <vector>

namespace firemote {
namespace remote {

/// @brief Default port of the remote control API
static constexpr Port API_PORT{8080};

/// @brief Default port of the DIAL app launcher
static constexpr Port DIAL_PORT{8009};

struct Device {
  string name;
  string host;
  Port port{API_PORT};

  bool operator==(const Device &) const = default;
};

using Devices = std::vector<Device>;

} // namespace remote
} // namespace firemote

template <> struct fmt::formatter<firemote::remote::Device> : fmt::formatter<std::string_view> {

  template <typename FormatContext>
  auto format(const firemote::remote::Device &dev, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{} ({})", dev.name, dev.host);
  }
};
