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


#include "term/keyboard.hpp"
#include "base/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace firemote {
namespace term {

static constexpr char ESC{0x1b};
static constexpr char CTRL_C{0x03};
static constexpr char DEL{0x7f};
static constexpr char BS{0x08};

RawMode::RawMode(int fd) noexcept : fd(fd) {
  INFO_AUTO_CAT("raw_mode");

  if (tcgetattr(fd, &orig) != 0) {
    INFO_AUTO("tcgetattr failed: {}", std::strerror(errno));
    return;
  }

  termios raw = orig;
  raw.c_lflag &= ~(ICANON | ECHO | ISIG);
  raw.c_iflag &= ~(IXON | ICRNL);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &raw) != 0) {
    INFO_AUTO("tcsetattr failed: {}", std::strerror(errno));
    return;
  }

  saved = true;
}

RawMode::~RawMode() noexcept {
  INFO_AUTO_CAT("raw_mode");

  if (saved && (tcsetattr(fd, TCSADRAIN, &orig) != 0)) {
    INFO_AUTO("restore failed: {}", std::strerror(errno));
  }
}

KeyPress Keyboard::read(Millis wait) const noexcept {
  RawMode raw(fd);

  if (!readable(wait)) return KeyPress();

  std::array<char, 3> buf{0};
  size_t len{0};

  if (::read(fd, buf.data(), 1) != 1) return KeyPress();
  len = 1;

  // the remainder of an escape sequence arrives immediately
  if (buf[0] == ESC) {
    for (; (len < buf.size()) && readable(Millis(50)); ++len) {
      if (::read(fd, buf.data() + len, 1) != 1) break;
    }
  }

  return decode(csv(buf.data(), len));
}

KeyPress Keyboard::decode(csv bytes) noexcept {
  if (bytes.empty()) return KeyPress();

  if ((bytes.size() == 3) && (bytes[0] == ESC) && (bytes[1] == '[')) {
    switch (bytes[2]) {
    case 'A':
      return KeyPress{.key = Key::Up};
    case 'B':
      return KeyPress{.key = Key::Down};
    case 'C':
      return KeyPress{.key = Key::Right};
    case 'D':
      return KeyPress{.key = Key::Left};
    default:
      return KeyPress();
    }
  }

  const auto c = bytes[0];

  if (bytes.size() > 1) return KeyPress(); // unrecognized sequence

  if ((c == '\r') || (c == '\n')) return KeyPress{.key = Key::Enter};
  if ((c == DEL) || (c == BS)) return KeyPress{.key = Key::Backspace};
  if (c == CTRL_C) return KeyPress{.key = Key::Interrupt};

  return KeyPress{.key = Key::Char, .ch = c};
}

bool Keyboard::readable(Millis wait) const noexcept {
  pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};

  return (poll(&pfd, 1, static_cast<int>(wait.count())) > 0) && (pfd.revents & POLLIN);
}

} // namespace term
} // namespace firemote
