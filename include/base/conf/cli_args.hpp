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

#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <sstream>

namespace firemote {
namespace conf {

/// @brief Command line options and positional command, parsed once in main()
///        into a toml table that master merges over the configuration file
struct cli_args {
  friend struct fixed;
  friend class master;

  cli_args(int argc, char **argv) noexcept;

  static bool error() noexcept { return !error_str.empty(); }
  static const string &error_msg() noexcept { return error_str; }

  // --help (-h)
  static bool help() noexcept { return help_requested; }
  static string help_msg() noexcept { return help_ss.str(); }

  /// @brief Proceed with the command (no help requested, no parse error)
  static bool nominal_start() noexcept { return !help_requested && error_str.empty(); }

  static const toml::table &table() noexcept { return ttable; }

protected:
  static toml::table ttable;

private:
  static string error_str;
  static bool help_requested;
  static std::ostringstream help_ss;
};

} // namespace conf
} // namespace firemote
