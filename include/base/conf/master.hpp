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

#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"

#include <array>
#include <filesystem>

namespace firemote {
namespace conf {

/// @brief Owner of the merged configuration: defaults < config file < command line.
///        Modules access their portion through conf::token.
class master {
public:
  // note: ordered by relevance
  enum MSG_TYPE : uint8_t { ParseMsg = 0, InitMsg };

public:
  master() = delete;

  /// @brief Build the configuration table from the parsed command line
  ///        and the configuration file it names (or the default file, if present)
  /// @return boolean indicating the configuration is usable
  static bool init() noexcept;

  /// @brief Replace the configuration with the parsed contents of a toml
  ///        document (primarily for tests and embedded configurations)
  /// @param raw toml text
  /// @return boolean indicating parse success
  static bool init_from(csv raw) noexcept;

  /// @brief Copy the subtable at root into dest (empty table when absent)
  /// @param root module id
  /// @param dest destination table
  static void copy_to(csv root, toml::table &dest) noexcept;

  /// @brief Default configuration file location honoring XDG_CONFIG_HOME
  /// @return path
  static std::filesystem::path default_cfg_file() noexcept;

  static const string &get_msg(MSG_TYPE t) noexcept { return msgs[t]; }

  static bool parse_ok() noexcept { return msgs[ParseMsg].empty(); }

  static const toml::table &table_direct() noexcept { return ttable; }

private:
  static void apply_cli() noexcept;
  static void merge(toml::table &dest, const toml::table &src) noexcept;

private:
  static toml::table ttable;
  static std::array<string, 2> msgs;

public:
  MOD_ID("conf.master");
};

} // namespace conf
} // namespace firemote
