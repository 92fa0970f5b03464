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
#include "remote/device.hpp"
#include "remote/remote.hpp"
#include "remote/session.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace firemote {

class App {
public:
  /// @brief Construct the App object.
  ///        CLI arguments have already been handled and
  ///        the application is on the cusp of starting.
  App() noexcept;

  /// @brief Similar to 'C' main. Loads the configuration, creates the
  ///        logger and runs the requested command.
  /// @return process exit code
  int main();

private:
  int dispatch();

  // commands
  int cmd_apps();
  int cmd_capabilities();
  int cmd_discover();
  int cmd_key();
  int cmd_keyboard();
  int cmd_launch();
  int cmd_pair();
  int cmd_properties();
  int cmd_remote();
  int cmd_seek();
  int cmd_status();
  int cmd_text();

  /// @brief Session for the --host device or, without one, a discovered device
  /// @param choose let the user pick when more than one device is found
  /// @return session or nullptr when no device is available
  std::unique_ptr<remote::Session> connect(bool choose);

  /// @brief Interactive PIN handshake
  /// @return true when paired
  bool pair(remote::Session &session);

  /// @brief Launch the remote control service so it accepts pairing
  void wake(remote::Session &session);

  void interactive(remote::Session &session);

  std::optional<remote::Device> select_device(const remote::Devices &devices);

private:
  // order dependent
  const std::vector<string> args;
  string command;

public:
  MOD_ID("app");
};

} // namespace firemote
