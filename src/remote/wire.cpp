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


#include "remote/wire.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>

namespace firemote {
namespace remote {
namespace wire {

namespace {
constexpr std::array key_actions{"keyDown"sv, "keyUp"sv};
constexpr std::array scan_directions{"forward"sv, "backward"sv};
constexpr std::array navs{"dpad_up"sv, "dpad_down"sv, "dpad_left"sv, "dpad_right"sv, "select"sv};
constexpr std::array buttons{"back"sv, "home"sv, "menu"sv};
} // namespace

csv to_string(KeyAction ka) noexcept { return key_actions[static_cast<uint8_t>(ka)]; }
csv to_string(ScanDirection sd) noexcept { return scan_directions[static_cast<uint8_t>(sd)]; }
csv to_string(Nav nav) noexcept { return navs[static_cast<uint8_t>(nav)]; }
csv to_string(Button button) noexcept { return buttons[static_cast<uint8_t>(button)]; }

string action_path(csv action) noexcept { return fmt::format("/v1/FireTV?action={}", action); }

std::optional<ScanDirection> scan_direction(csv text) noexcept {
  if (auto it = std::find(scan_directions.begin(), scan_directions.end(), text);
      it != scan_directions.end()) {
    return static_cast<ScanDirection>(std::distance(scan_directions.begin(), it));
  }

  return std::nullopt;
}

std::vector<string> utf8_chars(csv text) noexcept {
  std::vector<string> chars;

  for (size_t i = 0; i < text.size();) {
    const auto lead = static_cast<uint8_t>(text[i]);

    size_t len{1};
    if ((lead & 0xe0) == 0xc0) {
      len = 2;
    } else if ((lead & 0xf0) == 0xe0) {
      len = 3;
    } else if ((lead & 0xf8) == 0xf0) {
      len = 4;
    }

    // a multi-byte sequence is whole only when every following byte is a
    // continuation byte, otherwise the lead byte stands alone
    if ((len > 1) && (i + len <= text.size())) {
      for (size_t n = 1; n < len; ++n) {
        if ((static_cast<uint8_t>(text[i + n]) & 0xc0) != 0x80) {
          len = 1;
          break;
        }
      }
    } else {
      len = 1;
    }

    chars.emplace_back(text.substr(i, len));
    i += len;
  }

  return chars;
}

} // namespace wire
} // namespace remote
} // namespace firemote
