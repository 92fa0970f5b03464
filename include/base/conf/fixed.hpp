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

#include <filesystem>
#include <optional>
#include <vector>

namespace firemote {
namespace conf {

/// @brief Values fixed for the life of the process, determined at build
///        time or from the command line
struct fixed {

  using fs_path = std::filesystem::path;

  /// @brief Application name from CMakeList project definition (e.g. firemote)
  /// @return constant string view
  static csv app_name() noexcept;

  /// @brief Version from CMakeList project definition
  /// @return constant string view
  static csv app_version() noexcept;

  /// @brief Positional arguments following the command
  /// @return modifiable copy of the arguments (possibly empty)
  static std::vector<string> args() noexcept;

  /// @brief Command requested on the command line
  /// @return command or the empty string
  static string command() noexcept;

  /// @brief Device host given on the command line
  /// @return host when specified
  static std::optional<string> host() noexcept;

  /// @brief Log file path given on the command line
  /// @return path when specified
  static std::optional<fs_path> log_file() noexcept;

  /// @brief Client token given on the command line
  /// @return token when specified
  static std::optional<string> token() noexcept;
};

} // namespace conf
} // namespace firemote
