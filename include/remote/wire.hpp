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

#include <optional>
#include <vector>

namespace firemote {
namespace remote {

enum class KeyAction : uint8_t { Down = 0, Up };
enum class ScanDirection : uint8_t { Forward = 0, Backward };
enum class Nav : uint8_t { Up = 0, Down, Left, Right, Select };
enum class Button : uint8_t { Back = 0, Home, Menu };

namespace wire {

// fixed request headers
static constexpr csv accept{"*/*"};
static constexpr csv api_key{"0987654321"};
static constexpr csv content_json{"application/json; charset=utf-8"};
static constexpr csv content_text{"text/plain"};

// header names
static constexpr csv hdr_accept{"accept"};
static constexpr csv hdr_api_key{"x-api-key"};
static constexpr csv hdr_client_token{"x-client-token"};
static constexpr csv hdr_content_type{"content-type"};
static constexpr csv hdr_request_id{"x-amzn-request-id"};
static constexpr csv hdr_user_agent{"user-agent"};

// reply and request body keys
static constexpr csv key_action_type{"keyActionType"};
static constexpr csv key_description{"description"};
static constexpr csv key_direction{"direction"};
static constexpr csv key_duration{"durationInSeconds"};
static constexpr csv key_friendly_name{"friendlyName"};
static constexpr csv key_pin{"pin"};
static constexpr csv key_speed{"speed"};
static constexpr csv key_text{"text"};

static constexpr csv ack{"OK"};

// api paths
static constexpr csv path_apps{"/v1/FireTV/appsV2"};
static constexpr csv path_capabilities{"/v1/FireTV2"};
static constexpr csv path_keyboard{"/v1/FireTV/keyboard"};
static constexpr csv path_media_play{"/v1/media?action=play"};
static constexpr csv path_media_scan{"/v1/media?action=scan"};
static constexpr csv path_pin_display{"/v1/FireTV/pin/display"};
static constexpr csv path_pin_verify{"/v1/FireTV/pin/verify"};
static constexpr csv path_properties{"/v1/FireTV/properties"};
static constexpr csv path_status{"/v1/FireTV/status"};
static constexpr csv path_text{"/v1/FireTV/text"};

// DIAL
static constexpr csv dial_apps{"/apps/"};
static constexpr csv dial_default_app{"FireTVRemote"};

csv to_string(KeyAction ka) noexcept;
csv to_string(ScanDirection sd) noexcept;
csv to_string(Nav nav) noexcept;
csv to_string(Button button) noexcept;

/// @brief Target path of a key or navigation action
/// @param action wire name of the action (e.g. dpad_up)
/// @return path including the action query
string action_path(csv action) noexcept;

/// @brief Parse a direction given by a user ("forward", "backward")
std::optional<ScanDirection> scan_direction(csv text) noexcept;

/// @brief Split text into its UTF-8 characters (one string per code point)
///        invalid or truncated sequences are passed through one byte at a time
std::vector<string> utf8_chars(csv text) noexcept;

} // namespace wire
} // namespace remote
} // namespace firemote
