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
#include "remote/types.hpp"

#include <ArduinoJson.h>
#include <utility>
#include <vector>

namespace firemote {
namespace remote {

using JsonDoc = DynamicJsonDocument;

/// @brief Flat request body, every value is sent as a json string
using Fields = std::vector<std::pair<string, string>>;

namespace json {

/// @brief Parse a reply body
/// @param body raw reply body
/// @return parsed document, a null document when body is empty
/// @throws ProtocolError when the body is not valid json
JsonDoc parse(const string &body);

/// @brief Serialize fields as a json object of strings
string serialize(const Fields &fields) noexcept;

/// @brief Render a json value as text: strings as is, null as the empty
///        string, anything else as compact json
string text(JsonVariantConst v) noexcept;

/// @brief The description field of a reply (empty when absent)
string description(const JsonDoc &doc) noexcept;

/// @brief Top level fields of a json object
/// @throws ProtocolError when the document is neither null nor an object
Snapshot snapshot(const JsonDoc &doc);

/// @throws ProtocolError when the document is neither null nor an object
DeviceProperties properties(const JsonDoc &doc);

/// @throws ProtocolError when the document is neither null nor an array of objects
Apps apps(const JsonDoc &doc);

} // namespace json
} // namespace remote
} // namespace firemote
