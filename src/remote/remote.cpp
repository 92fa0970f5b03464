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


#include "remote/remote.hpp"
#include "base/logger.hpp"
#include "remote/error.hpp"
#include "remote/json.hpp"

#include <fmt/format.h>

namespace firemote {
namespace remote {

bool Remote::navigate(Nav nav) {
  INFO_AUTO_CAT("navigate");
  require_token();

  const auto path = wire::action_path(wire::to_string(nav));
  auto key = [](KeyAction ka) {
    return Fields{{string(wire::key_action_type), string(wire::to_string(ka))}};
  };

  // a failed key down must not leave the key held, the key up is always sent
  try {
    if (!post(path, key(KeyAction::Down))) INFO_AUTO("{} key down not acknowledged", path);
  } catch (const Error &e) {
    INFO_AUTO("{} key down failed: {}", path, e.what());
  }

  return post(path, key(KeyAction::Up));
}

bool Remote::press(Button button) {
  require_token();

  return post(wire::action_path(wire::to_string(button)));
}

bool Remote::play_pause() {
  require_token();

  return post(wire::path_media_play);
}

bool Remote::send_text(csv text) {
  INFO_AUTO_CAT("send_text");
  require_token();

  for (const auto &ch : wire::utf8_chars(text)) {
    if (!send_char(ch)) {
      INFO_AUTO("stopped at '{}'", ch);
      return false;
    }
  }

  return true;
}

bool Remote::send_char(csv ch) {
  require_token();

  return post(wire::path_text, Fields{{string(wire::key_text), string(ch)}});
}

bool Remote::seek(ScanDirection direction, int seconds, int speed) {
  require_token();

  return post(wire::path_media_scan,
              Fields{{string(wire::key_direction), string(wire::to_string(direction))},
                     {string(wire::key_duration), fmt::format("{}", seconds)},
                     {string(wire::key_speed), fmt::format("{}", speed)}});
}

bool Remote::fast_forward(int seconds) { return seek(ScanDirection::Forward, seconds); }

bool Remote::rewind(int seconds) { return seek(ScanDirection::Backward, seconds); }

Snapshot Remote::status() { return json::snapshot(get(wire::path_status)); }

DeviceProperties Remote::properties() { return json::properties(get(wire::path_properties)); }

Snapshot Remote::capabilities() { return json::snapshot(get(wire::path_capabilities)); }

Apps Remote::apps() { return json::apps(get(wire::path_apps)); }

Snapshot Remote::keyboard_state() { return json::snapshot(get(wire::path_keyboard)); }

bool Remote::launch_app(csv app_name) {
  require_token();

  return session.launch_app(app_name);
}

bool Remote::post(csv path, const std::optional<Fields> &body) {
  const auto reply = session.request(Method::Post, path, true, body);

  return json::description(reply) == wire::ack;
}

JsonDoc Remote::get(csv path) {
  require_token();

  return session.request(Method::Get, path, true);
}

void Remote::require_token() const {
  if (!session.paired()) throw AuthenticationRequired();
}

} // namespace remote
} // namespace firemote
