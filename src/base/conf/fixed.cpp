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


#include "base/conf/fixed.hpp"
#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "build_inject.hpp"

namespace firemote {
namespace conf {

using fs_path = std::filesystem::path;

csv fixed::app_name() noexcept { return build::info.project; }

csv fixed::app_version() noexcept { return build::info.version; }

std::vector<string> fixed::args() noexcept {
  std::vector<string> out;

  if (const auto *arr = cli_args::ttable[key::args].as_array(); arr) {
    arr->for_each([&out](auto &&el) {
      if constexpr (toml::is_string<decltype(el)>) out.emplace_back(el.get());
    });
  }

  return out;
}

string fixed::command() noexcept { return cli_args::ttable[key::command].value_or(string()); }

std::optional<string> fixed::host() noexcept {
  return cli_args::ttable[key::host].value<string>();
}

std::optional<fs_path> fixed::log_file() noexcept {
  if (auto f = cli_args::ttable[key::log_file].value<string>(); f) return fs_path(*f);

  return std::nullopt;
}

std::optional<string> fixed::token() noexcept {
  return cli_args::ttable[key::token].value<string>();
}

} // namespace conf
} // namespace firemote
