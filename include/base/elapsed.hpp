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

#include <chrono>

namespace firemote {

/// @brief Steady clock stopwatch started at construction
class Elapsed {
public:
  using clock = std::chrono::steady_clock;

public:
  Elapsed() noexcept : start(clock::now()) {}

  Nanos operator()() const noexcept { return clock::now() - start; }

  /// @brief Elapsed time as the requested duration (e.g. Millis, millis_fp)
  template <typename TO>
    requires IsDuration<TO>
  TO as() const noexcept {
    return std::chrono::duration_cast<TO>((*this)());
  }

  void restart() noexcept { start = clock::now(); }

private:
  clock::time_point start;
};

} // namespace firemote
