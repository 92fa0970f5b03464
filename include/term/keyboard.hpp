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

#include <termios.h>
#include <unistd.h>

namespace firemote {
namespace term {

enum class Key : uint8_t { None = 0, Up, Down, Left, Right, Enter, Backspace, Interrupt, Char };

struct KeyPress {
  Key key{Key::None};
  char ch{0};

  bool operator==(const KeyPress &) const = default;
};

/// @brief Terminal in raw mode (no echo, no line buffering, no signals)
///        for the life of the object
class RawMode {
public:
  explicit RawMode(int fd) noexcept;
  ~RawMode() noexcept;

  RawMode(const RawMode &) = delete;
  RawMode &operator=(const RawMode &) = delete;

  bool active() const noexcept { return saved; }

private:
  int fd;
  termios orig{};
  bool saved{false};
};

/// @brief Single key presses from a terminal
class Keyboard {
public:
  explicit Keyboard(int fd = STDIN_FILENO) noexcept : fd(fd) {}

  /// @brief Wait up to wait for a key press
  /// @return the key or Key::None when nothing arrived
  KeyPress read(Millis wait) const noexcept;

  /// @brief Decode the bytes of one key press (a character or an escape sequence)
  static KeyPress decode(csv bytes) noexcept;

private:
  bool readable(Millis wait) const noexcept;

private:
  int fd;

public:
  MOD_ID("term.keyboard");
};

} // namespace term
} // namespace firemote
