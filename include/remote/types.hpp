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

#include <map>
#include <vector>

namespace firemote {
namespace remote {

/// @brief Top level fields of an untyped reply, rendered as text
using Snapshot = std::map<string, string>;

struct App {
  string app_id;
  string name;
  bool is_installed{false};
  bool is_shortcut{false};
  string icon_url;
  string launch_intent;
};

using Apps = std::vector<App>;

struct DeviceProperties {
  string os_version;
  string platform_type;
  string turnstile_version;
  string epg_support;
  string power_support;
  string volume_support;
  string pfm;
};

} // namespace remote
} // namespace firemote
