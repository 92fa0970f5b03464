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
#include "remote/session.hpp"
#include "remote/types.hpp"
#include "remote/wire.hpp"

namespace firemote {
namespace remote {

/// @brief Remote control vocabulary over a paired session
///
/// Every operation requires a client token and throws AuthenticationRequired,
/// before anything is sent, when the session has none. Operations returning
/// bool report whether the device acknowledged the command. Network failures
/// throw TransportError.
class Remote {
public:
  static constexpr int def_seek_secs{10};
  static constexpr int def_seek_speed{1};

public:
  explicit Remote(Session &session) noexcept : session(session) {}

  // navigation, a key down followed by a key up
  bool up() { return navigate(Nav::Up); }
  bool down() { return navigate(Nav::Down); }
  bool left() { return navigate(Nav::Left); }
  bool right() { return navigate(Nav::Right); }
  bool select() { return navigate(Nav::Select); }

  // single shot buttons
  bool back() { return press(Button::Back); }
  bool home() { return press(Button::Home); }
  bool menu() { return press(Button::Menu); }

  bool play_pause();

  /// @brief Send text one character at a time, stops at the first
  ///        character the device does not acknowledge
  /// @return true when every character was acknowledged
  bool send_text(csv text);

  /// @brief Send a single (UTF-8) character
  bool send_char(csv ch);

  bool seek(ScanDirection direction, int seconds = def_seek_secs, int speed = def_seek_speed);
  bool fast_forward(int seconds = def_seek_secs);
  bool rewind(int seconds = def_seek_secs);

  Snapshot status();
  DeviceProperties properties();
  Snapshot capabilities();
  Apps apps();
  Snapshot keyboard_state();

  /// @brief Launch an app through DIAL
  /// @return true when the device replies 201 Created
  bool launch_app(csv app_name = wire::dial_default_app);

private:
  bool navigate(Nav nav);
  bool press(Button button);

  /// @brief Authenticated POST, true when acknowledged
  bool post(csv path, const std::optional<Fields> &body = std::nullopt);

  /// @brief Authenticated GET
  JsonDoc get(csv path);

  void require_token() const;

private:
  Session &session;

public:
  MOD_ID("remote");
};

} // namespace remote
} // namespace firemote
