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

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace firemote {

using namespace std::literals;

using string = std::string;
using string_view = std::string_view;

typedef const std::string_view csv;
typedef const char *ccs;

template <typename T, typename... U>
concept IsAnyOf = (std::same_as<T, U> || ...);

template <typename T>
concept AlwaysFalse = false;

using Port = uint16_t;

using Nanos = std::chrono::nanoseconds;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using Minutes = std::chrono::minutes;
using millis_fp = std::chrono::duration<double, std::chrono::milliseconds::period>;

template <typename T>
concept IsDuration = requires(T d) {
  typename T::rep;
  typename T::period;
  { d.count() } -> std::same_as<typename T::rep>;
};

#define MOD_ID(mid)                                                                                \
  static constexpr std::string_view module_id { mid }

} // namespace firemote
