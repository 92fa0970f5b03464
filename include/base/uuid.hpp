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

#include <array>
#include <fmt/format.h>
#include <uuid/uuid.h>

namespace firemote {

/// @brief Random (version 4) UUID in its lower case text form
struct UUID {
  friend struct fmt::formatter<UUID>;

  UUID() noexcept {
    uuid_t bin;
    uuid_generate_random(bin);

    std::array<char, 37> buf{0}; // 36 chars + null
    uuid_unparse_lower(bin, buf.data());
    text.assign(buf.data());
  }

  const string &operator()() const noexcept { return text; }

  bool operator==(const UUID &rhs) const = default;

private:
  string text;
};

} // namespace firemote

/// @brief 'f' formats the full UUID, the default is the final group only
template <> struct fmt::formatter<firemote::UUID> {
  bool full{false};

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();

    if ((it != ctx.end()) && (*it == 'f')) {
      full = true;
      ++it;
    }

    if ((it != ctx.end()) && (*it != '}')) throw format_error("invalid uuid format");

    return it;
  }

  template <typename FormatContext>
  auto format(const firemote::UUID &uuid, FormatContext &ctx) const -> decltype(ctx.out()) {
    std::string_view sv(uuid.text);

    if (!full) sv.remove_prefix(sv.find_last_of('-') + 1);

    return fmt::format_to(ctx.out(), "{}", sv);
  }
};
